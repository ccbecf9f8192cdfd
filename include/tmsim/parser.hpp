#pragma once

#include "tmsim/machine.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace tmsim {

// Raised for any malformed machine description
struct ConfigError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A property line ("key: value") is any line containing ':'
bool IsProperty(const std::string& line);

// Parse the name/init/accept properties. Lines that are not properties are
// skipped, so a whole machine file may be passed.
MachineConfig ParseConfig(const std::vector<std::string>& lines);

// Parse transition rules from line pairs
//   state, read
//   next, write, dir
// Property lines are skipped.
TransitionTable ParseTransitions(const std::vector<std::string>& lines);

// Both passes over one line list
MachineDefinition ParseMachine(const std::vector<std::string>& lines);

}  // namespace tmsim
