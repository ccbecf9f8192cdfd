#include "tmsim/parser.hpp"
#include "tmsim/text.hpp"

#include <cctype>
#include <optional>

namespace tmsim {

namespace {

std::string ToLower(std::string s) {
  for (char& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

// Split on every separator and trim each field. Empty fields are kept.
std::vector<std::string> SplitFields(const std::string& s, char sep) {
  std::vector<std::string> fields;
  size_t start = 0;
  while (true) {
    size_t pos = s.find(sep, start);
    if (pos == std::string::npos) {
      fields.push_back(Trim(s.substr(start)));
      break;
    }
    fields.push_back(Trim(s.substr(start, pos - start)));
    start = pos + 1;
  }
  return fields;
}

// Exactly one code point. Combining sequences count as several.
Symbol ParseSymbol(const std::string& field, const char* what) {
  std::u32string cps;
  try {
    cps = DecodeUtf8(field);
  } catch (const EncodingError& e) {
    throw ConfigError(std::string(what) + " symbol '" + field + "' is not valid UTF-8: " + e.what());
  }
  if (cps.size() != 1) {
    throw ConfigError(std::string(what) + " symbol for transition must be one character, but was '" +
                      field + "'");
  }
  return cps[0];
}

}  // namespace

bool IsProperty(const std::string& line) {
  return line.find(':') != std::string::npos;
}

MachineConfig ParseConfig(const std::vector<std::string>& lines) {
  std::vector<std::string> props;
  for (const auto& line : lines) {
    if (IsProperty(line)) props.push_back(line);
  }

  if (props.size() < 2 || props.size() > 3) {
    throw ConfigError("Wrong number of machine properties: expected 2 or 3, found " +
                      std::to_string(props.size()));
  }

  MachineConfig config;
  std::optional<State> init;
  bool have_accept = false;

  for (const auto& line : props) {
    size_t colon = line.find(':');
    std::string key = ToLower(Trim(line.substr(0, colon)));
    std::string value = Trim(line.substr(colon + 1));

    if (key == "name") {
      config.name = value;
    } else if (key == "init") {
      init = value;
    } else if (key == "accept") {
      config.accept_states = SplitFields(value, ',');
      have_accept = true;
    } else {
      throw ConfigError("Unknown property in line: " + line);
    }
  }

  if (!init) {
    throw ConfigError("Initial state must be defined (missing 'init')");
  }
  if (!have_accept || config.accept_states.empty()) {
    throw ConfigError("At least one accept state must be defined (missing 'accept')");
  }

  config.initial_state = *init;
  return config;
}

TransitionTable ParseTransitions(const std::vector<std::string>& lines) {
  std::vector<std::string> rule_lines;
  for (const auto& line : lines) {
    if (!IsProperty(line)) rule_lines.push_back(Trim(line));
  }

  if (rule_lines.empty()) {
    throw ConfigError("No transitions defined");
  }
  if (rule_lines.size() % 2 != 0) {
    throw ConfigError("Transitions are defined in line pairs, but found " +
                      std::to_string(rule_lines.size()) + " lines; unpaired line: " +
                      rule_lines.back());
  }

  TransitionTable table;
  for (size_t i = 0; i < rule_lines.size(); i += 2) {
    const std::string& from = rule_lines[i];
    const std::string& to = rule_lines[i + 1];

    auto lhs = SplitFields(from, ',');
    if (lhs.size() != 2) {
      throw ConfigError("Expected 'state, symbol' but got: " + from);
    }
    auto rhs = SplitFields(to, ',');
    if (rhs.size() != 3) {
      throw ConfigError("Expected 'state, symbol, direction' but got: " + to);
    }

    TransitionRule rule;
    rule.state = lhs[0];
    rule.read = ParseSymbol(lhs[1], "Read");
    rule.next = rhs[0];
    rule.write = ParseSymbol(rhs[1], "Write");

    auto dir = DirectionFromToken(rhs[2]);
    if (!dir) {
      throw ConfigError("Invalid direction '" + rhs[2] + "' in line: " + to);
    }
    rule.dir = *dir;

    table.Add(rule);
  }

  return table;
}

MachineDefinition ParseMachine(const std::vector<std::string>& lines) {
  MachineDefinition def;
  def.config = ParseConfig(lines);
  def.transitions = ParseTransitions(lines);
  return def;
}

}  // namespace tmsim
