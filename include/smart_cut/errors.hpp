/**
 * @file errors.hpp
 * @brief Central error types
 *
 * @details Synchronous errors (validation, admission, status lookups) are
 *          thrown to the caller. Errors raised inside a job worker are caught
 *          and recorded on the job; callers only see them by polling.
 */

#ifndef SMART_CUT_ERRORS_HPP
#define SMART_CUT_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace smart_cut {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

// **----- REQUEST ERRORS -----**

/// Rule violated by a delete segment
enum class ValidationRule {
  Empty,            //< no segments at all
  MissingBound,     //< start or end absent
  NonFiniteBound,   //< start or end is NaN or infinite
  NegativeBound,    //< start or end below zero
  StartNotBeforeEnd, //< start >= end
  ExceedsDuration,  //< bound beyond the media duration
  NoRemainingContent,
  BadSelection,     //< transcript word selection out of range
  Malformed         //< request payload of the wrong shape
};

class ValidationError : public Error {
public:
  /**
   * @param msg Human readable description
   * @param index 1-based index of the offending segment (0 = whole request)
   * @param rule The rule that failed
   */
  ValidationError(const std::string &msg, std::size_t index,
                  ValidationRule rule)
      : Error(msg), index_(index), rule_(rule) {}

  std::size_t index() const { return index_; }
  ValidationRule rule() const { return rule_; }

private:
  std::size_t index_;
  ValidationRule rule_;
};

/// The delete set covers the whole file
class NoRemainingContentError : public ValidationError {
public:
  explicit NoRemainingContentError(const std::string &msg)
      : ValidationError(msg, 0, ValidationRule::NoRemainingContent) {}
};

class FileNotFoundError : public Error {
public:
  explicit FileNotFoundError(const std::string &msg) : Error(msg) {}
};

// **----- ORCHESTRATOR ERRORS -----**

/// Admission rejected: the concurrency ceiling is reached
class TooManyJobsError : public Error {
public:
  explicit TooManyJobsError(const std::string &msg) : Error(msg) {}
};

class NotFoundError : public Error {
public:
  explicit NotFoundError(const std::string &msg) : Error(msg) {}
};

/// The job was terminal past its retention window and has been evicted
class ExpiredError : public Error {
public:
  explicit ExpiredError(const std::string &msg) : Error(msg) {}
};

// **----- EXTERNAL TOOL ERRORS -----**

enum class ProbeFailure { Timeout, ToolFailure, ParseError };

class ProbeError : public Error {
public:
  ProbeError(const std::string &msg, ProbeFailure kind)
      : Error(msg), kind_(kind) {}

  ProbeFailure kind() const { return kind_; }

private:
  ProbeFailure kind_;
};

/// Encoder exited non-zero; stderr is kept verbatim
class EncodeError : public Error {
public:
  EncodeError(const std::string &msg, int exit_code, std::string stderr_text)
      : Error(msg), exit_code_(exit_code),
        stderr_text_(std::move(stderr_text)) {}

  int exit_code() const { return exit_code_; }
  const std::string &stderr_text() const { return stderr_text_; }

private:
  int exit_code_;
  std::string stderr_text_;
};

class EncodeTimeoutError : public Error {
public:
  explicit EncodeTimeoutError(const std::string &msg) : Error(msg) {}
};

/// Encoder exited zero but left no usable output file
class OutputMissingError : public Error {
public:
  explicit OutputMissingError(const std::string &msg) : Error(msg) {}
};

/// Every keep segment fell below the encode floor
class NoValidSegmentsError : public Error {
public:
  explicit NoValidSegmentsError(const std::string &msg) : Error(msg) {}
};

class EncodeSetupError : public Error {
public:
  explicit EncodeSetupError(const std::string &msg) : Error(msg) {}
};

class ConfigError : public Error {
public:
  explicit ConfigError(const std::string &msg) : Error(msg) {}
};

} // namespace smart_cut

#endif // SMART_CUT_ERRORS_HPP
