#pragma once

#include <stdexcept>
#include <string>

namespace cellroute {

// Graph or container content that cannot be served.
class DataError : public std::runtime_error {
public:
  explicit DataError(const std::string& message) : std::runtime_error(message) {}
};

// A snap bucket that breaks the sorted/parallel layout the lookups rely on.
class IndexCorruptionError : public DataError {
public:
  explicit IndexCorruptionError(const std::string& message) : DataError(message) {}
};

// Builder input that cannot form a graph. Aborts the build run.
class MalformedInputError : public std::runtime_error {
public:
  explicit MalformedInputError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace cellroute
