#include "rk/cli.hpp"
#include <iostream>

int main(int argc, char** argv) {
  return rk::run_cli(argc, argv, std::cout, std::cerr);
}
