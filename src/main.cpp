// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/application.hpp"
#include "app/command_line.hpp"
#include "util/logging.hpp"

#include <iostream>
#include <string>
#include <sysexits.h>
#include <vector>

int main(int argc, char* argv[]) {
  using namespace tarpit;

  try {
    std::vector<std::string> args(argv + 1, argv + argc);
    app::ParseResult parsed = app::ParseCommandLine(args);

    switch (parsed.status) {
    case app::ParseStatus::ShowHelp:
      std::cout << app::Usage(argv[0]);
      return EX_OK;
    case app::ParseStatus::ShowVersion:
      std::cout << app::VersionString() << std::endl;
      return EX_OK;
    case app::ParseStatus::Error:
      std::cerr << "Error: " << parsed.error << "\n\n" << app::Usage(argv[0]);
      return EX_USAGE;
    case app::ParseStatus::Run:
      break;
    }

    const app::AppConfig& config = parsed.config;
    util::LogManager::Initialize(util::LogManager::LevelForVerbosity(config.verbosity), config.log_file.has_value(),
                                 config.log_file.value_or(""));

    int exit_code = EX_OK;
    {
      app::Application application(config);
      if (!application.initialize()) {
        exit_code = EX_OSERR;
      } else if (!application.start()) {
        exit_code = EX_SOFTWARE;
      } else {
        application.wait_for_shutdown();
      }
    }

    util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return EX_SOFTWARE;
  }
}
