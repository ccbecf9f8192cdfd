#include "tmsim/simulator.hpp"
#include "tmsim/text.hpp"
#include <algorithm>
#include <cstddef>

namespace tmsim {

Simulator::Simulator(const MachineConfig& config, const TransitionTable& transitions,
                     const std::string& input)
    : transitions_(transitions),
      accept_states_(config.accept_states),
      user_accept_count_(config.accept_states.size()),
      head_(0),
      state_(config.initial_state),
      steps_(0) {
  std::u32string cells = DecodeUtf8(input);
  tape_.assign(cells.begin(), cells.end());
  accept_states_.push_back(kRejectState);
}

bool Simulator::Step() {
  const long long size = static_cast<long long>(tape_.size());

  // Cells off either end read as blank
  Symbol current = (head_ >= 0 && head_ < size) ? tape_[static_cast<size_t>(head_)] : kBlank;

  const TransitionRule* rule = transitions_.Find(state_, current);
  ++steps_;
  if (rule == nullptr) {
    state_ = kRejectState;
    return false;
  }

  if (head_ < 0) {
    // Grow left; the new cell becomes index 0
    tape_.push_front(current);
    head_ = 0;
  } else if (head_ >= size) {
    // Grow right; head_ already indexes the new cell
    tape_.push_back(current);
  } else {
    tape_[static_cast<size_t>(head_)] = rule->write;
  }

  switch (rule->dir) {
    case Direction::Left:
      --head_;
      break;
    case Direction::Right:
      ++head_;
      break;
    case Direction::Halt:
      break;
  }

  state_ = rule->next;
  return !IsTerminal();
}

RunResult Simulator::Run(long long max_steps) {
  return Run(max_steps, nullptr);
}

RunResult Simulator::Run(long long max_steps, const std::function<void(const Simulator&)>& on_step) {
  long long budget = 0;
  bool hit_limit = false;
  do {
    if (max_steps > 0 && budget >= max_steps) {
      hit_limit = true;
      break;
    }
    Step();
    ++budget;
    if (on_step) on_step(*this);
  } while (!IsTerminal());

  RunResult result;
  result.state = state_;
  result.tape = tape_;
  result.head = head_;
  result.steps = steps_;
  result.accepted = Accepted();
  result.hit_limit = hit_limit;
  return result;
}

bool Simulator::IsTerminal() const {
  return std::find(accept_states_.begin(), accept_states_.end(), state_) != accept_states_.end();
}

bool Simulator::Accepted() const {
  auto user_end = accept_states_.begin() + static_cast<std::ptrdiff_t>(user_accept_count_);
  return std::find(accept_states_.begin(), user_end, state_) != user_end;
}

RunState Simulator::CurrentState() const {
  return {tape_, head_, state_};
}

std::string FormatTape(const Tape& tape) {
  std::string out = "[";
  for (size_t i = 0; i < tape.size(); ++i) {
    if (i > 0) out += ", ";
    out += '\'';
    out += EncodeUtf8(tape[i]);
    out += '\'';
  }
  out += "]";
  return out;
}

}  // namespace tmsim
