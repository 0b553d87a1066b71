#pragma once
#include <stdexcept>
#include <string>

namespace crew {

// Fatal for the run: bad registries or schedule. Thrown before any
// optimization starts, so no partial results exist.
struct InputMalformed : std::runtime_error {
  using std::runtime_error::runtime_error;
};

[[noreturn]] inline void fail(const std::string& msg) {
  throw InputMalformed(msg);
}

} // namespace crew
