#include "tmsim/loader.hpp"
#include "tmsim/text.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tmsim {

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed.rfind("//", 0) == 0) continue;
    lines.push_back(trimmed);
  }
  return lines;
}

std::vector<std::string> LoadLines(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) {
    throw std::runtime_error("Cannot open machine file: " + path);
  }
  std::stringstream buffer;
  buffer << ifs.rdbuf();
  return SplitLines(buffer.str());
}

}  // namespace tmsim
