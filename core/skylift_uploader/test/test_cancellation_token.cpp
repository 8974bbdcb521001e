// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for CancellationToken
 */

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "cancellation_token.hpp"
#include "upload_errors.hpp"

using namespace skylift::uploader;

TEST(CancellationTokenTest, InitiallyNotCancelled) {
  CancellationToken token;
  EXPECT_FALSE(token.is_cancelled());
  EXPECT_EQ(token.reason(), "");
  EXPECT_NO_THROW(token.throw_if_cancelled("op"));
}

TEST(CancellationTokenTest, FirstReasonWins) {
  CancellationToken token;
  token.cancel("chunk 2 failed");
  token.cancel("chunk 3 failed");

  EXPECT_TRUE(token.is_cancelled());
  EXPECT_EQ(token.reason(), "chunk 2 failed");
}

TEST(CancellationTokenTest, ThrowIfCancelledNamesOperation) {
  CancellationToken token;
  token.cancel("caller abort");

  try {
    token.throw_if_cancelled("chunk-1");
    FAIL() << "expected OperationCancelled";
  } catch (const OperationCancelled& e) {
    EXPECT_NE(std::string(e.what()).find("chunk-1"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("caller abort"), std::string::npos);
    EXPECT_EQ(e.stage(), ErrorStage::Cancelled);
  }
}

TEST(CancellationTokenTest, SleepCompletesWhenNotCancelled) {
  CancellationToken token;
  EXPECT_TRUE(token.sleep_for(std::chrono::milliseconds(5)));
}

TEST(CancellationTokenTest, SleepReturnsEarlyOnCancel) {
  CancellationToken token;
  std::thread canceller([&token]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    token.cancel("stop");
  });

  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(token.sleep_for(std::chrono::seconds(30)));
  canceller.join();

  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(CancellationTokenTest, PastDeadlineCancels) {
  CancellationToken token;
  token.set_deadline(CancellationToken::clock::now() - std::chrono::milliseconds(1));

  EXPECT_TRUE(token.is_cancelled());
  EXPECT_EQ(token.reason(), "deadline exceeded");
  EXPECT_THROW(token.throw_if_cancelled("upload"), OperationCancelled);
}

TEST(CancellationTokenTest, DeadlineCutsSleepShort) {
  CancellationToken token;
  token.set_deadline(CancellationToken::clock::now() + std::chrono::milliseconds(20));

  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(token.sleep_for(std::chrono::seconds(30)));
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
  EXPECT_TRUE(token.is_cancelled());
}
