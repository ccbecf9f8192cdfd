#pragma once

#include <string>
#include <vector>

namespace tmsim {

// Split machine-file text into trimmed lines, dropping blank lines and
// "//" comment lines. Order is preserved.
std::vector<std::string> SplitLines(const std::string& text);

// Read a machine file and return SplitLines of its contents.
// Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> LoadLines(const std::string& path);

}  // namespace tmsim
