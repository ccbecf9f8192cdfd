#include "tmsim/driver.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv, argv + argc);
  return tmsim::RunCli(args, std::cout, std::cerr);
}
