#pragma once

#include <stdexcept>

namespace capital {

// Malformed account, mandate, kill switch or engine configuration. The engine
// refuses the offending account (or refuses to start) rather than guessing.
class ConfigurationError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

}  // namespace capital
