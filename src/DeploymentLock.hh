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

#ifndef DEPLOYMENT_LOCK_HH
#define DEPLOYMENT_LOCK_HH

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

#include <sys/types.h>

#include <boost/asio.hpp>
#include <boost/outcome/std_result.hpp>

#include "LogCollector.hh"

namespace outcome = boost::outcome_v2;

// Exclusive ownership of a deployment target. Released on destruction.
class LockHandle
{
public:
  LockHandle() = default;
  LockHandle(int fd, std::filesystem::path path);
  ~LockHandle();

  LockHandle(const LockHandle &) = delete;
  LockHandle &operator=(const LockHandle &) = delete;
  LockHandle(LockHandle &&other) noexcept;
  LockHandle &operator=(LockHandle &&other) noexcept;

  bool is_locked() const;
  void release();

private:
  int fd{-1};
  std::filesystem::path path;
};

// Serializes deployments of one webroot through `{webroot}.lock`, which holds the PID of the owner.
class DeploymentLock
{
public:
  DeploymentLock(std::filesystem::path webroot, LogCollector &collector, std::chrono::milliseconds poll_interval = default_poll_interval);

  boost::asio::awaitable<outcome::std_result<LockHandle>> acquire(std::chrono::milliseconds timeout = default_timeout);

  // Abandons a pending acquire(). Safe to call from any thread, whatever executor acquire() runs on.
  void cancel();

  std::filesystem::path get_lock_path() const;

  // PID recorded by the current holder, if any.
  std::optional<pid_t> get_holder() const;

  static constexpr std::chrono::milliseconds default_timeout{std::chrono::seconds{600}};
  static constexpr std::chrono::milliseconds default_poll_interval{std::chrono::seconds{10}};

private:
  outcome::std_result<bool> try_lock(int fd);
  static std::optional<pid_t> read_holder(int fd);
  bool is_cancelled();
  boost::asio::awaitable<void> sleep(std::shared_ptr<boost::asio::steady_timer> wait_timer, std::chrono::milliseconds duration);

private:
  std::filesystem::path lock_path;
  std::chrono::milliseconds poll_interval;
  std::mutex mutex;
  bool cancelled{false};
  std::shared_ptr<boost::asio::steady_timer> timer;
  std::shared_ptr<spdlog::logger> logger;
};

#endif // DEPLOYMENT_LOCK_HH
