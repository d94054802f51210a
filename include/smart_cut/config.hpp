/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/smart_cut.env for detailed documentation of each
 *          parameter.
 *
 * @note Values are read once per process. Components that need per-instance
 *       settings (tests, multiple orchestrators) take an options struct built
 *       from these values instead of calling Config:: directly.
 */

#ifndef SMART_CUT_CONFIG_HPP
#define SMART_CUT_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace smart_cut {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

// **---- JOBS ----**

/**
 * @brief Ceiling on jobs in the processing state
 * @note Also the size of the worker pool. Submissions beyond it are rejected,
 *       never queued.
 */
inline int max_concurrent_jobs() {
  static int val = get_env_int("MAX_CONCURRENT_JOBS", 2);
  return val;
}

/// Seconds a finished job stays queryable after its last update
inline double job_retention_sec() {
  static double val = get_env_double("JOB_RETENTION_SEC", 3600.0);
  return val;
}

/**
 * @brief Interval of the background expiry sweep (0 = disabled)
 * @note With the sweep disabled, finished jobs are only evicted when queried.
 */
inline double job_sweep_interval_sec() {
  static double val = get_env_double("JOB_SWEEP_INTERVAL_SEC", 0.0);
  return val;
}

// **---- SEGMENTS ----**

/// Keep segments this short or shorter are dropped
inline double min_segment_duration() {
  static double val = get_env_double("MIN_SEGMENT_DURATION", 0.1);
  return val;
}

// **---- EXTERNAL TOOLS ----**

inline std::string ffmpeg_path() {
  static std::string val = get_env_string("FFMPEG_PATH", "ffmpeg");
  return val;
}

inline std::string ffprobe_path() {
  static std::string val = get_env_string("FFPROBE_PATH", "ffprobe");
  return val;
}

/**
 * @brief Duration probe backend
 * @note "ffprobe" runs the external tool, "libav" opens the file in-process.
 */
inline std::string probe_backend() {
  static std::string val = get_env_string("PROBE_BACKEND", "ffprobe");
  return val;
}

/// Bound on a single duration probe
inline double probe_timeout_sec() {
  static double val = get_env_double("PROBE_TIMEOUT_SEC", 30.0);
  return val;
}

/// Bound on a single encode; long encodes are expected
inline double encode_timeout_sec() {
  static double val = get_env_double("ENCODE_TIMEOUT_SEC", 1800.0);
  return val;
}

// **---- OUTPUT ----**

/**
 * @brief Directory receiving cut files
 * @attention Must differ from the directory holding the inputs. It is expected
 *            to exist; it is not created on the hot path.
 */
inline std::string output_dir() {
  static std::string val = get_env_string("OUTPUT_DIR", "processed");
  return val;
}

/// x264 preset used for every re-encode
inline std::string video_preset() {
  static std::string val = get_env_string("VIDEO_PRESET", "fast");
  return val;
}

/// x264 constant rate factor
inline int video_crf() {
  static int val = get_env_int("VIDEO_CRF", 23);
  return val;
}

inline std::string audio_bitrate() {
  static std::string val = get_env_string("AUDIO_BITRATE", "128k");
  return val;
}

/**
 * @brief Encoder threads per job
 * @note 0 = auto-calculate as (available_cpus / MAX_CONCURRENT_JOBS)
 */
inline int encode_threads() {
  static int val = get_env_int("ENCODE_THREADS", 0);
  return val;
}

} // namespace Config
} // namespace smart_cut

#endif // SMART_CUT_CONFIG_HPP
