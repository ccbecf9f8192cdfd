#include <gtest/gtest.h>
#include "tmsim/loader.hpp"
#include "tmsim/parser.hpp"
#include "tmsim/simulator.hpp"
#include "tmsim/text.hpp"
#include <functional>
#include <set>

namespace tmsim {
namespace {

MachineDefinition LoadMachine(const std::string& path) {
  return ParseMachine(LoadLines(path));
}

// Generate all strings up to length n over alphabet
std::vector<std::string> AllStrings(const std::set<Symbol>& alphabet, int max_len) {
  std::vector<std::string> result;
  result.push_back("");
  std::vector<std::string> current = {""};
  for (int len = 1; len <= max_len; ++len) {
    std::vector<std::string> next;
    for (const auto& s : current) {
      for (Symbol c : alphabet) {
        std::string ns = s + EncodeUtf8(c);
        next.push_back(ns);
        result.push_back(ns);
      }
    }
    current = next;
  }
  return result;
}

// Tape contents without the blank margins
std::string Strip(const Tape& tape) {
  std::string s;
  for (Symbol c : tape) s += EncodeUtf8(c);
  size_t begin = s.find_first_not_of('_');
  if (begin == std::string::npos) return "";
  size_t end = s.find_last_not_of('_');
  return s.substr(begin, end - begin + 1);
}

std::string ToBinary(unsigned n) {
  if (n == 0) return "0";
  std::string s;
  while (n > 0) {
    s.insert(s.begin(), static_cast<char>('0' + (n & 1)));
    n >>= 1;
  }
  return s;
}

// ---- Oracles ----

// a^n b^n: equal count of a's and b's in a*b* form
bool IsAnBn(const std::string& s) {
  int n = 0, m = 0;
  bool in_b = false;
  for (char c : s) {
    if (c == 'a') {
      if (in_b) return false;
      ++n;
    } else if (c == 'b') {
      in_b = true;
      ++m;
    } else {
      return false;
    }
  }
  return n == m;
}

void VerifyExhaustive(const MachineDefinition& def,
                      const std::set<Symbol>& alphabet,
                      int max_len,
                      const std::function<bool(const std::string&)>& oracle) {
  for (const auto& input : AllStrings(alphabet, max_len)) {
    Simulator sim(def.config, def.transitions, input);
    RunResult result = sim.Run(100000);
    bool expected = oracle(input);
    EXPECT_FALSE(result.hit_limit) << "input=\"" << input << "\"";
    EXPECT_EQ(result.accepted, expected)
        << "input=\"" << input << "\": "
        << "oracle=" << (expected ? "accept" : "reject")
        << ", machine ended in " << result.state;
  }
}

// ---- Tests ----

TEST(ExampleTest, AnBn) {
  MachineDefinition def = LoadMachine(EXAMPLES_DIR "/anbn.tm");
  EXPECT_EQ(def.config.name, "a^n b^n");

  VerifyExhaustive(def, {'a', 'b'}, 8, IsAnBn);
}

TEST(ExampleTest, AnBnRejectLeavesTape) {
  MachineDefinition def = LoadMachine(EXAMPLES_DIR "/anbn.tm");
  Simulator sim(def.config, def.transitions, "ba");
  RunResult result = sim.Run();

  EXPECT_EQ(result.state, kRejectState);
  EXPECT_EQ(FormatTape(result.tape), "['b', 'a']");
  EXPECT_EQ(result.head + 1, 1);
}

TEST(ExampleTest, BinaryIncrement) {
  MachineDefinition def = LoadMachine(EXAMPLES_DIR "/binary_increment.tm");
  EXPECT_EQ(def.config.name, "Binary increment");

  for (unsigned n = 0; n < 64; ++n) {
    Simulator sim(def.config, def.transitions, ToBinary(n));
    RunResult result = sim.Run(10000);

    EXPECT_EQ(result.state, "qA") << "n=" << n;
    EXPECT_EQ(Strip(result.tape), ToBinary(n + 1)) << "n=" << n;
  }
}

TEST(ExampleTest, BinaryIncrementCarryGrowsLeft) {
  MachineDefinition def = LoadMachine(EXAMPLES_DIR "/binary_increment.tm");
  Simulator sim(def.config, def.transitions, "11");
  RunResult result = sim.Run();

  EXPECT_EQ(result.state, "qA");
  EXPECT_EQ(FormatTape(result.tape), "['1', '0', '0', '_']");
  EXPECT_EQ(result.head + 1, 1);
}

TEST(ExampleTest, BinaryIncrementEmptyInput) {
  MachineDefinition def = LoadMachine(EXAMPLES_DIR "/binary_increment.tm");
  Simulator sim(def.config, def.transitions, "");
  RunResult result = sim.Run();

  EXPECT_EQ(result.state, "qA");
  EXPECT_EQ(FormatTape(result.tape), "['1', '_']");
}

}  // namespace
}  // namespace tmsim
