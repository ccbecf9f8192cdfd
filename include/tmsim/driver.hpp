#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace tmsim {

// Command-line entry point. args[0] is the program name. The report goes
// to out; usage, diagnostics and traces go to err.
// Returns 0 on a completed run, 1 on a usage, file or parse error and 2
// when --max-steps is reached.
int RunCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

}  // namespace tmsim
