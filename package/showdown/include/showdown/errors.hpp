#pragma once

#include <stdexcept>
#include <string>

namespace showdown {

// Malformed caller input, raised before any solver or pipeline work starts.
class ValidationError : public std::invalid_argument {
public:
  explicit ValidationError(const std::string &what)
      : std::invalid_argument(what) {}
};

// Raised at a step boundary once a CancellationToken has been triggered.
class Cancelled : public std::runtime_error {
public:
  explicit Cancelled(const std::string &what) : std::runtime_error(what) {}
};

} // namespace showdown
