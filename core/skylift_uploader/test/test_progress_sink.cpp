// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include <skylift_log_init.hpp>

#include "progress_sink.hpp"

using namespace skylift::uploader;

TEST(ProgressSinkTest, NullSinkAcceptsReports) {
  NullProgressSink sink;
  IProgressSink& base = sink;
  EXPECT_NO_THROW(base.report("chunk-0", "attempt 1 failed"));
}

TEST(ProgressSinkTest, LogSinkKeepsVerbosity) {
  EXPECT_FALSE(LogProgressSink().verbose());
  EXPECT_TRUE(LogProgressSink(true).verbose());
}

TEST(ProgressSinkTest, LogSinkReportsWithoutLoggingInitialized) {
  LogProgressSink quiet;
  LogProgressSink verbose(true);
  EXPECT_NO_THROW(quiet.report("onboard", "HTTP 503"));
  EXPECT_NO_THROW(verbose.report("upload", "connection reset"));
}

TEST(ProgressSinkTest, LogSinkReportsFromWorkerThreads) {
  skylift::logging::LoggingConfig config;
  config.console_enabled = false;
  skylift::logging::init_logging(config);

  LogProgressSink sink(true);
  std::vector<std::thread> workers;
  for (int i = 0; i < 4; ++i) {
    workers.emplace_back([&sink, i]() {
      for (int n = 0; n < 25; ++n) {
        sink.report("chunk-" + std::to_string(i), "attempt " + std::to_string(n));
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  skylift::logging::shutdown_logging();
}
