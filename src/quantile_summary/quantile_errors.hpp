#pragma once

#include <stdexcept>
#include <string>

// epsilon outside (0, 1), phi outside [0, 1], or an unusable parameter
class ConfigurationError : public std::invalid_argument {
  public:
    explicit ConfigurationError(const std::string &what) : std::invalid_argument(what) {}
};

// Non-orderable observation (NaN). The summary is left untouched.
class InvalidValueError : public std::invalid_argument {
  public:
    explicit InvalidValueError(const std::string &what) : std::invalid_argument(what) {}
};

// Query issued against a summary that has absorbed no observation.
class EmptyQueryError : public std::runtime_error {
  public:
    explicit EmptyQueryError(const std::string &what) : std::runtime_error(what) {}
};

// The two summaries do not share a representation that can be interleaved.
class IncompatibleMergeError : public std::invalid_argument {
  public:
    explicit IncompatibleMergeError(const std::string &what) : std::invalid_argument(what) {}
};
