#pragma once

#include "tmsim/machine.hpp"
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace tmsim {

// Grows at both ends only
using Tape = std::deque<Symbol>;

// Terminal state entered when no rule matches
constexpr const char* kRejectState = "REJECT";

// Outcome of a run
struct RunResult {
  State state;
  Tape tape;
  long long head;  // 0-based
  long long steps;
  bool accepted;   // ended in a user accept state
  bool hit_limit;
};

// Snapshot of the machine between steps
struct RunState {
  Tape tape;
  long long head;
  State state;
};

// Executes a machine on one input tape. The head may sit one cell past
// either end of the tape between steps; the tape only grows when a rule
// fires from such a cell.
class Simulator {
public:
  // input is UTF-8, one cell per code point. Throws EncodingError if it
  // is malformed.
  Simulator(const MachineConfig& config, const TransitionTable& transitions,
            const std::string& input);

  // Apply one transition. Returns false once a terminal state is reached.
  bool Step();

  // Step until a terminal state is reached, checking after every step, so
  // at least one step always runs. max_steps == 0 means no limit.
  RunResult Run(long long max_steps = 0);

  // As Run, calling on_step after every step
  RunResult Run(long long max_steps, const std::function<void(const Simulator&)>& on_step);

  bool IsTerminal() const;
  bool Accepted() const;

  const State& CurrentStateName() const { return state_; }
  const Tape& CurrentTape() const { return tape_; }
  long long Head() const { return head_; }
  long long Steps() const { return steps_; }
  const std::vector<State>& AcceptStates() const { return accept_states_; }
  RunState CurrentState() const;

private:
  const TransitionTable& transitions_;
  std::vector<State> accept_states_;  // user accept states + kRejectState
  size_t user_accept_count_;

  Tape tape_;
  long long head_;
  State state_;
  long long steps_;
};

// Render a tape as a UTF-8 character listing: ['1', '_']
std::string FormatTape(const Tape& tape);

}  // namespace tmsim
