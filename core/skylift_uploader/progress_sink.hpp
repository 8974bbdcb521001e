// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_PROGRESS_SINK_HPP
#define SKYLIFT_PROGRESS_SINK_HPP

#include <string>

namespace skylift {
namespace uploader {

/**
 * Narrow progress capability injected into a session.
 *
 * Implementations must return quickly and must not throw; the upload path
 * calls report() from worker threads.
 */
class IProgressSink {
public:
  virtual ~IProgressSink() = default;

  virtual void report(const std::string& label, const std::string& detail) noexcept = 0;
};

/**
 * Discards every report.
 */
class NullProgressSink : public IProgressSink {
public:
  void report(const std::string&, const std::string&) noexcept override {}
};

/**
 * Forwards reports to the skylift logger: INFO when verbose, DEBUG otherwise.
 * The logging sinks are asynchronous and drop on overflow, so this never
 * blocks the caller.
 */
class LogProgressSink : public IProgressSink {
public:
  explicit LogProgressSink(bool verbose = false)
      : verbose_(verbose) {}

  void report(const std::string& label, const std::string& detail) noexcept override;

  bool verbose() const {
    return verbose_;
  }

private:
  bool verbose_;
};

}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_PROGRESS_SINK_HPP
