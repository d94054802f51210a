/**
 * @file job_json.hpp
 * @brief JSON encoding of jobs and decoding of delete-range requests
 *
 * @details The to_json() overloads are found by nlohmann::json through ADL,
 *          so `nlohmann::json j = job;` works directly.
 *
 *          Job layout:
 *
 *          {"id", "status", "progress", "result"?, "error"?,
 *           "created_at", "updated_at"}
 *
 *          Timestamps are ISO-8601 UTC with milliseconds.
 */

#ifndef SMART_CUT_JOB_JSON_HPP
#define SMART_CUT_JOB_JSON_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "job.hpp"
#include "types.hpp"

namespace smart_cut {

/// "processing", "completed" or "failed"
const char *status_name(JobStatus status);

void to_json(nlohmann::json &j, const Segment &s);
void to_json(nlohmann::json &j, const JobResult &r);
void to_json(nlohmann::json &j, const Job &job);

/**
 * @brief Decode delete ranges.
 *
 * @param j Either an array of {"start": .., "end": ..} objects or an object
 *          holding that array under "segments"
 * @return One SegmentInput per entry; missing or null bounds stay empty
 * @throws ValidationError (Malformed) when the payload has the wrong shape or
 *         a bound is not a number
 */
std::vector<SegmentInput> parse_segment_inputs(const nlohmann::json &j);

/**
 * @brief Read and decode a delete-range file.
 * @throws FileNotFoundError when the file cannot be opened
 * @throws ValidationError (Malformed) on invalid JSON
 */
std::vector<SegmentInput> load_segment_inputs(const std::string &path);

} // namespace smart_cut

#endif // SMART_CUT_JOB_JSON_HPP
