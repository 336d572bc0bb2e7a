// Copyright (C) 2026 The sitedeploy authors
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#ifndef LOG_COLLECTOR_HH
#define LOG_COLLECTOR_HH

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/sinks/ringbuffer_sink.h>

#include "utils/Logging.hh"

#include "MailTransport.hh"

// Buffers the log of one deployment and mails it as a single notification.
class LogCollector
{
public:
  LogCollector(std::shared_ptr<MailTransport> transport, std::vector<std::string> recipients, std::string description);

  LogCollector(const LogCollector &) = delete;
  LogCollector &operator=(const LogCollector &) = delete;
  LogCollector(LogCollector &&) = delete;
  LogCollector &operator=(LogCollector &&) = delete;

  // Loggers that write to the default sinks and to this collector.
  std::shared_ptr<spdlog::logger> create_logger(std::string domain);

  std::vector<std::string> get_lines() const;

  // Only the first call sends a notification.
  void flush(bool success);
  bool is_flushed() const;

  static constexpr std::size_t max_lines = 10000;
  static constexpr auto pattern = "[%Y-%m-%d %H:%M:%S] [%l] %v";

private:
  std::shared_ptr<MailTransport> transport;
  std::vector<std::string> recipients;
  std::string description;
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink;
  std::once_flag flushed_flag;
  bool flushed{false};
  std::shared_ptr<spdlog::logger> logger{sitedeploy::utils::Logging::create("sitedeploy:collector")};
};

#endif // LOG_COLLECTOR_HH
