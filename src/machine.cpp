#include "tmsim/machine.hpp"

namespace tmsim {

std::optional<Direction> DirectionFromToken(const std::string& token) {
  if (token == "<") return Direction::Left;
  if (token == ">") return Direction::Right;
  if (token == "-") return Direction::Halt;
  return std::nullopt;
}

char DirectionToken(Direction dir) {
  switch (dir) {
    case Direction::Left:
      return '<';
    case Direction::Right:
      return '>';
    case Direction::Halt:
      return '-';
  }
  return '-';
}

bool TransitionTable::Add(const TransitionRule& rule) {
  auto& candidates = index_[{rule.state, rule.read}];
  for (size_t i : candidates) {
    if (rules_[i] == rule) return false;
  }
  candidates.push_back(rules_.size());
  rules_.push_back(rule);
  return true;
}

const TransitionRule* TransitionTable::Find(const State& state, Symbol read) const {
  auto it = index_.find({state, read});
  if (it == index_.end() || it->second.empty()) {
    return nullptr;
  }
  return &rules_[it->second.front()];
}

std::set<State> TransitionTable::States() const {
  std::set<State> states;
  for (const auto& rule : rules_) {
    states.insert(rule.state);
    states.insert(rule.next);
  }
  return states;
}

std::set<Symbol> TransitionTable::Symbols() const {
  std::set<Symbol> symbols;
  for (const auto& rule : rules_) {
    symbols.insert(rule.read);
    symbols.insert(rule.write);
  }
  return symbols;
}

}  // namespace tmsim
