#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace lscan {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class ConfigErrc {
  MissingFilename,
  InvalidFilterType,
  InvalidMapperType,
  InvalidFieldSpecification,
  MissingBound,
  InvalidBound,
};

const char* to_string(ConfigErrc c) noexcept;

// Raised synchronously while building a scan.
class ConfigError : public Error {
public:
  ConfigError(ConfigErrc code, const std::string& detail);
  ConfigErrc code() const noexcept { return code_; }

private:
  ConfigErrc code_;
};

// A line that could not be turned into a record (bad JSON, non-object in strict
// mode, unparseable timestamp). line() is 1-based; 0 when unknown.
class DecodeError : public Error {
public:
  DecodeError(std::uint64_t line, const std::string& detail);
  std::uint64_t line() const noexcept { return line_; }

private:
  std::uint64_t line_;
};

// The input could not be opened or read.
class SourceError : public Error {
public:
  SourceError(const std::string& path, int err);
  int error_code() const noexcept { return err_; }

private:
  int err_;
};

class ScanStateError : public Error {
public:
  using Error::Error;
};

}
