// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// skylift_upload - upload a file to the platform file service, onboarding
// the agent first when needed

#include <exception>
#include <iostream>

#include "commands.hpp"

/**
 * Main entry point for skylift_upload
 */
int main(int argc, char* argv[]) {
  skylift::cli::Commands commands;

  try {
    return commands.execute(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
