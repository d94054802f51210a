/**
 * @file process.hpp
 * @brief Bounded execution of external command-line tools
 *
 * @details ffprobe and ffmpeg run as child processes. The runner:
 *
 *          - passes arguments as a vector (no shell, no quoting issues)
 *
 *          - captures stdout and stderr through pipes
 *
 *          - kills the child when the timeout elapses
 *
 * @note Failures are reported through ProcessResult, never thrown. Callers
 *       decide which outcome maps to which error.
 */

#ifndef SMART_CUT_PROCESS_HPP
#define SMART_CUT_PROCESS_HPP

#include <chrono>
#include <string>
#include <vector>

namespace smart_cut {

/**
 * @struct ProcessResult
 * @brief Outcome of one child process.
 */
struct ProcessResult {
  int exit_code = -1;        //< Exit status, 128 + signal when killed
  bool timed_out = false;    //< Killed because the timeout elapsed
  bool spawn_failed = false; //< fork/exec failed; error holds the reason
  std::string stdout_text;
  std::string stderr_text;
  std::string error; //< Runner-side failure description

  bool ok() const { return !spawn_failed && !timed_out && exit_code == 0; }
};

/**
 * @brief Run a program to completion or until the timeout elapses.
 *
 * @param program Executable name (resolved through PATH) or path
 * @param args Arguments, excluding the program name
 * @param timeout Wall-clock bound; the child is killed with SIGKILL past it
 * @return Exit status and captured output
 */
ProcessResult run_process(const std::string &program,
                          const std::vector<std::string> &args,
                          std::chrono::milliseconds timeout);

/**
 * @brief Render a command line for logging, quoting arguments when needed.
 */
std::string render_command_line(const std::string &program,
                                const std::vector<std::string> &args);

} // namespace smart_cut

#endif // SMART_CUT_PROCESS_HPP
