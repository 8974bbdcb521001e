// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "progress_sink.hpp"

#include <iostream>

#define SKYLIFT_LOG_COMPONENT "progress"
#include <skylift_log_macros.hpp>

namespace skylift {
namespace uploader {

void LogProgressSink::report(const std::string& label, const std::string& detail) noexcept {
  try {
    if (verbose_) {
      SKYLIFT_LOG_INFO(label << ": " << detail);
    } else {
      SKYLIFT_LOG_DEBUG(label << ": " << detail);
    }
  } catch (const std::exception& e) {
    std::cerr << "[progress] " << label << ": " << detail << " (logging failed: " << e.what()
              << ")" << std::endl;
  }
}

}  // namespace uploader
}  // namespace skylift
