// src/main.cpp
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "cli/Cli.hpp"

int main(int argc, char** argv) {
  spdlog::set_level(syncmeta::logLevelFromEnv());
  return syncmeta::runCli(std::vector<std::string>(argv, argv + argc), std::cout);
}
