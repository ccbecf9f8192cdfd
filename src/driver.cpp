#include "tmsim/driver.hpp"
#include "tmsim/loader.hpp"
#include "tmsim/machine.hpp"
#include "tmsim/parser.hpp"
#include "tmsim/simulator.hpp"

#include <exception>

namespace tmsim {

namespace {

void PrintUsage(const std::string& prog, std::ostream& err) {
  err << "tmsim - Turing Machine Simulator\n\n";
  err << "Runs a single-tape machine written in the turingmachinesimulator.com syntax.\n\n";
  err << "Usage: " << prog << " -f <machine file> -i <input>\n";
  err << "\nOptions:\n";
  err << "  -f, --input_file <file>  Machine definition file\n";
  err << "  -i, --input <string>     Initial tape contents (UTF-8)\n";
  err << "  -v                       Verbose output\n";
  err << "  --trace                  Print every step to stderr\n";
  err << "  --max-steps <n>          Stop after n steps (default: no limit)\n";
  err << "  -h, --help               Show this message\n";
}

}  // namespace

int RunCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
  const std::string prog = args.empty() ? "tmsim" : args[0];
  const size_t argc = args.size();

  std::string input_file;
  std::string tape_input;
  bool have_input = false;
  bool verbose = false;
  bool trace = false;
  long long max_steps = 0;

  for (size_t i = 1; i < argc; ++i) {
    const std::string& arg = args[i];
    if ((arg == "-f" || arg == "--input_file") && i + 1 < argc) {
      input_file = args[++i];
    } else if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
      tape_input = args[++i];
      have_input = true;
    } else if (arg == "-v") {
      verbose = true;
    } else if (arg == "--trace") {
      trace = true;
    } else if (arg == "--max-steps" && i + 1 < argc) {
      try {
        max_steps = std::stoll(args[++i]);
      } catch (const std::exception&) {
        err << "Error: Invalid step limit: " << args[i] << "\n";
        return 1;
      }
      if (max_steps < 0) {
        err << "Error: Step limit must not be negative\n";
        return 1;
      }
    } else if (arg == "-h" || arg == "--help") {
      PrintUsage(prog, err);
      return 0;
    } else {
      err << "Unknown option: " << arg << "\n";
      PrintUsage(prog, err);
      return 1;
    }
  }

  if (input_file.empty() || !have_input) {
    err << "Error: Both a machine file (-f) and an input (-i) are required\n";
    PrintUsage(prog, err);
    return 1;
  }

  try {
    if (verbose) err << "Loading " << input_file << "...\n";
    std::vector<std::string> lines = LoadLines(input_file);

    MachineDefinition def = ParseMachine(lines);
    if (verbose) {
      err << "Machine: " << def.config.name << "\n";
      err << "  Initial state: " << def.config.initial_state << "\n";
      err << "  Accept states: " << def.config.accept_states.size() << "\n";
      err << "  States: " << def.transitions.States().size() << "\n";
      err << "  Symbols: " << def.transitions.Symbols().size() << "\n";
      err << "  Transitions: " << def.transitions.Size() << "\n";
      err << "Running on input: \"" << tape_input << "\"\n";
    }

    Simulator sim(def.config, def.transitions, tape_input);

    RunResult result;
    if (trace) {
      result = sim.Run(max_steps, [&err](const Simulator& s) {
        err << "[" << s.Steps() << "] " << s.CurrentStateName() << " "
            << FormatTape(s.CurrentTape()) << " head=" << s.Head() + 1 << "\n";
      });
    } else {
      result = sim.Run(max_steps);
    }

    out << "Ended in state " << result.state << "\n";
    out << "Tape was: " << FormatTape(result.tape) << "\n";
    out << "Tape head was at position " << result.head + 1 << "\n";

    if (verbose) {
      err << "Steps: " << result.steps << "\n";
      err << "Result: " << (result.accepted ? "ACCEPT" : "REJECT") << "\n";
    }
    if (result.hit_limit) {
      err << "WARNING: Hit step limit\n";
      return 2;
    }

  } catch (const std::exception& e) {
    err << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}

}  // namespace tmsim
