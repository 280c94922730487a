#pragma once
/*
================================================================================
Core: Error Types
FILE: cpp/engine/core/errors.hpp

Purpose:
  - One exception family for the whole engine so callers can catch by category:
      * ValidationError  -> a contract breach at an engine entry point or a bad
                            settings value (user input is reported as
                            ValidationIssue lists, never thrown)
      * LookupError      -> unknown species / wind preset id
      * IOError          -> a CSV bundle could not be written
  - Every error carries a stable ErrorCode and the throw site.

Rules:
  - The threshold solver never throws (absent thresholds are std::nullopt).
  - An infinite safety factor is a result, not an error.
================================================================================
*/

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace arbor {

// Stable codes; keep values fixed once exported by the CLI.
enum class ErrorCode : std::uint16_t {
  kInvalidInput      = 10,
  kInvalidConfig     = 11,
  kUnknownSpecies    = 20,
  kUnknownWindPreset = 21,
  kIoError           = 40,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidInput:      return "InvalidInput";
    case ErrorCode::kInvalidConfig:     return "InvalidConfig";
    case ErrorCode::kUnknownSpecies:    return "UnknownSpecies";
    case ErrorCode::kUnknownWindPreset: return "UnknownWindPreset";
    case ErrorCode::kIoError:           return "IoError";
    default:                            return "Unknown";
  }
}

struct ErrorSite final {
  const char* file = "";
  const char* func = "";
  int line = 0;
};

// Base error for the engine.
class ArborError : public std::runtime_error {
 public:
  ArborError(ErrorCode code, const std::string& msg, ErrorSite site = {})
      : std::runtime_error(build_what(code, msg, site)), code_(code), message_(msg), site_(site) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const ErrorSite& where() const noexcept { return site_; }

 private:
  static std::string build_what(ErrorCode code, const std::string& msg, const ErrorSite& site) {
    std::ostringstream oss;
    oss << "[arbor " << to_string(code) << "(" << static_cast<int>(code) << ")] "
        << (msg.empty() ? std::string{"<empty error message>"} : msg);
    if (site.file && *site.file) {
      oss << " @ " << site.file << ":" << site.line;
      if (site.func && *site.func) oss << " (" << site.func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  ErrorSite site_;
};

// Thrown when an engine entry point or a settings block gets a value outside
// its contract. field names the offending input ("geometry.dbh_cm", ...).
class ValidationError : public ArborError {
 public:
  explicit ValidationError(std::string msg, std::string field = {}, ErrorSite site = {})
      : ArborError(ErrorCode::kInvalidInput, msg, site), field_(std::move(field)) {}

  ValidationError(ErrorCode code, std::string msg, std::string field, ErrorSite site)
      : ArborError(code, msg, site), field_(std::move(field)) {}

  const std::string& field() const noexcept { return field_; }

 private:
  std::string field_;
};

// Thrown by catalogue at() for an id that is not in the catalogue.
class LookupError : public ArborError {
 public:
  LookupError(ErrorCode code, std::string key, ErrorSite site = {})
      : ArborError(code, "unknown id '" + key + "'", site), key_(std::move(key)) {}

  const std::string& key() const noexcept { return key_; }

 private:
  std::string key_;
};

// Thrown by the CSV bundle writer; path names the file that failed.
class IOError : public ArborError {
 public:
  IOError(std::string msg, std::string path, ErrorSite site = {})
      : ArborError(ErrorCode::kIoError, msg, site), path_(std::move(path)) {}

  const std::string& path() const noexcept { return path_; }

 private:
  std::string path_;
};

}  // namespace arbor

#define ARBOR_SITE ::arbor::ErrorSite{__FILE__, __func__, __LINE__}

// Hard contract check at engine entry points. Throws ValidationError naming FIELD.
#define ARBOR_REQUIRE(cond, field, msg)                              \
  do {                                                               \
    if (!(cond)) {                                                   \
      throw ::arbor::ValidationError((msg), (field), ARBOR_SITE);    \
    }                                                                \
  } while (0)
