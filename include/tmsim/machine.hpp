#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tmsim {

//=============================================================================
// Symbols and directions
//=============================================================================

enum class Direction { Left, Right, Halt };

// One Unicode code point; machine files are UTF-8
using Symbol = char32_t;
constexpr Symbol kBlank = U'_';

using State = std::string;

// Tokens used in machine files: '<' left, '>' right, '-' stay
std::optional<Direction> DirectionFromToken(const std::string& token);
char DirectionToken(Direction dir);

//=============================================================================
// Transition rules
//=============================================================================

// One delta entry: (state, read) -> (next, write, dir)
struct TransitionRule {
  State state;
  Symbol read;
  State next;
  Symbol write;
  Direction dir;

  bool operator==(const TransitionRule& other) const {
    return state == other.state && read == other.read && next == other.next &&
           write == other.write && dir == other.dir;
  }
  bool operator!=(const TransitionRule& other) const { return !(*this == other); }
};

// The transition relation. Identical rules collapse on insertion. Several
// distinct rules may share a (state, read) pair; Find returns the one that
// was added first.
class TransitionTable {
public:
  // Returns false if an identical rule was already present
  bool Add(const TransitionRule& rule);

  const TransitionRule* Find(const State& state, Symbol read) const;

  size_t Size() const { return rules_.size(); }
  bool Empty() const { return rules_.empty(); }

  // Rules in insertion order
  const std::vector<TransitionRule>& Rules() const { return rules_; }

  std::set<State> States() const;
  std::set<Symbol> Symbols() const;

private:
  std::vector<TransitionRule> rules_;
  // (state, read) -> indices into rules_, in insertion order
  std::map<std::pair<State, Symbol>, std::vector<size_t>> index_;
};

//=============================================================================
// Machine configuration
//=============================================================================

struct MachineConfig {
  std::string name = "Turing Machine";
  State initial_state;
  std::vector<State> accept_states;
};

// Everything a machine file describes
struct MachineDefinition {
  MachineConfig config;
  TransitionTable transitions;
};

}  // namespace tmsim
