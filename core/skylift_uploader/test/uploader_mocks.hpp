// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_UPLOADER_MOCKS_HPP
#define SKYLIFT_UPLOADER_MOCKS_HPP

#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <ios>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "progress_sink.hpp"
#include "uploader_interfaces.hpp"

namespace skylift {
namespace uploader {
namespace test {

/**
 * Mock implementation of IFileSystem for testing
 */
class MockFileSystem : public IFileSystem {
public:
  MOCK_METHOD(bool, exists, (const std::string& path), (const, override));
  MOCK_METHOD(bool, is_regular_file, (const std::string& path), (const, override));
  MOCK_METHOD(uint64_t, file_size, (const std::string& path), (const, override));
};

/**
 * Mock implementation of IFileStream for testing
 */
class MockFileStream : public IFileStream {
public:
  MOCK_METHOD(IFileStream&, read, (char* buffer, std::streamsize size), (override));
  MOCK_METHOD(
    IFileStream&, seekg, (std::streamoff offset, std::ios_base::seekdir origin), (override)
  );
  MOCK_METHOD(std::streamsize, gcount, (), (const, override));
  MOCK_METHOD(bool, good, (), (const, override));
  MOCK_METHOD(bool, fail, (), (const, override));
  MOCK_METHOD(bool, bad, (), (const, override));
};

/**
 * Mock implementation of IFileStreamFactory for testing
 */
class MockFileStreamFactory : public IFileStreamFactory {
public:
  MOCK_METHOD(
    std::unique_ptr<IFileStream>, create_file_stream,
    (const std::string& path, std::ios_base::openmode mode), (override)
  );
};

/**
 * Mock implementation of ITransportClient for testing
 */
class MockTransportClient : public ITransportClient {
public:
  MOCK_METHOD(TransportResult, begin_multipart, (const UploadTarget& target), (override));
  MOCK_METHOD(
    TransportResult, send,
    (const UploadTarget& target, const std::string& payload, const PartMetadata& metadata),
    (override)
  );
  MOCK_METHOD(
    TransportResult, complete_multipart, (const UploadTarget& target, size_t part_count),
    (override)
  );
};

class MockProgressSink : public IProgressSink {
public:
  MOCK_METHOD(
    void, report, (const std::string& label, const std::string& detail), (noexcept, override)
  );
};

/**
 * Thread-safe fake transport that records every call.
 *
 * gmock expectations are awkward across worker threads; this fake keeps the
 * payload of every acknowledged part so tests can reassemble the upload and
 * check ordering and fail-fast behaviour.
 */
class RecordingTransport : public ITransportClient {
public:
  struct SendRecord {
    std::optional<size_t> part_index;
    size_t bytes;
    std::chrono::steady_clock::time_point at;
  };

  TransportResult begin_multipart(const UploadTarget&) override {
    begin_calls++;
    return TransportResult::Success();
  }

  TransportResult send(
    const UploadTarget&, const std::string& payload, const PartMetadata& metadata
  ) override {
    size_t key = metadata.part_index ? *metadata.part_index : 0;
    int active = in_flight.fetch_add(1) + 1;
    int seen = max_in_flight.load();
    while (active > seen && !max_in_flight.compare_exchange_weak(seen, active)) {
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      sends_.push_back({metadata.part_index, payload.size(), std::chrono::steady_clock::now()});
    }

    if (send_delay.count() > 0) {
      std::this_thread::sleep_for(send_delay);
    }

    TransportResult result = TransportResult::Success("\"etag-" + std::to_string(key) + "\"");
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto failures = transient_failures_.find(key);
      if (always_fail_.count(key) > 0) {
        result = TransportResult::Failure("simulated outage", true, 503);
      } else if (failures != transient_failures_.end() && failures->second > 0) {
        failures->second--;
        result = TransportResult::Failure("simulated timeout", true, 0);
      } else {
        parts_[key] = payload;
      }
    }

    in_flight--;
    return result;
  }

  TransportResult complete_multipart(const UploadTarget&, size_t part_count) override {
    complete_calls++;
    completed_part_count = part_count;
    return TransportResult::Success("\"final\"", complete_hash);
  }

  void fail_always(size_t part) {
    std::lock_guard<std::mutex> lock(mutex_);
    always_fail_.insert(part);
  }

  void fail_times(size_t part, int times) {
    std::lock_guard<std::mutex> lock(mutex_);
    transient_failures_[part] = times;
  }

  std::vector<SendRecord> sends() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sends_;
  }

  size_t send_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sends_.size();
  }

  /**
   * Acknowledged payloads concatenated in index order.
   */
  std::string assembled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    for (const auto& part : parts_) {
      out += part.second;
    }
    return out;
  }

  std::set<size_t> sent_parts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<size_t> parts;
    for (const auto& record : sends_) {
      if (record.part_index) {
        parts.insert(*record.part_index);
      }
    }
    return parts;
  }

  std::atomic<int> begin_calls{0};
  std::atomic<int> complete_calls{0};
  std::atomic<size_t> completed_part_count{0};
  std::atomic<int> in_flight{0};
  std::atomic<int> max_in_flight{0};
  std::chrono::milliseconds send_delay{0};
  std::string complete_hash;

private:
  mutable std::mutex mutex_;
  std::vector<SendRecord> sends_;
  std::map<size_t, std::string> parts_;
  std::set<size_t> always_fail_;
  std::map<size_t, int> transient_failures_;
};

}  // namespace test
}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_UPLOADER_MOCKS_HPP
