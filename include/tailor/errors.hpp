#pragma once
#include <stdexcept>
#include <string>

namespace tailor {

// Decision record is structurally malformed (missing field, wrong type, non-finite value).
class InvalidInputError : public std::runtime_error {
public:
  explicit InvalidInputError(const std::string& msg) : std::runtime_error(msg) {}
};

// advance() was called on a closed run.
class RunClosedError : public std::runtime_error {
public:
  explicit RunClosedError(const std::string& msg) : std::runtime_error(msg) {}
};

}
