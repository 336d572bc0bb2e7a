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

#include "DeploymentLock.hh"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "sitedeploy/SiteDeployErrors.hh"

using namespace sitedeploy;

namespace
{
  std::optional<pid_t> parse_pid(const char *data, std::size_t size)
  {
    pid_t pid = 0;
    auto [ptr, ec] = std::from_chars(data, data + size, pid);
    if (ec != std::errc() || ptr == data || pid <= 0)
      {
        return {};
      }
    return pid;
  }
} // namespace

LockHandle::LockHandle(int fd, std::filesystem::path path)
  : fd(fd)
  , path(std::move(path))
{
}

LockHandle::~LockHandle()
{
  release();
}

LockHandle::LockHandle(LockHandle &&other) noexcept
  : fd(std::exchange(other.fd, -1))
  , path(std::move(other.path))
{
}

LockHandle &
LockHandle::operator=(LockHandle &&other) noexcept
{
  if (this != &other)
    {
      release();
      fd = std::exchange(other.fd, -1);
      path = std::move(other.path);
    }
  return *this;
}

bool
LockHandle::is_locked() const
{
  return fd >= 0;
}

void
LockHandle::release()
{
  if (fd < 0)
    {
      return;
    }

  // Clear the PID first so the file never names a process that no longer holds the lock.
  if (::ftruncate(fd, 0) != 0)
    {
      spdlog::warn("failed to clear lock file {} ({})", path.string(), std::strerror(errno));
    }
  ::flock(fd, LOCK_UN);
  ::close(fd);
  fd = -1;
}

DeploymentLock::DeploymentLock(std::filesystem::path webroot, LogCollector &collector, std::chrono::milliseconds poll_interval)
  : lock_path(webroot.string() + ".lock")
  , poll_interval(poll_interval)
  , logger(collector.create_logger("sitedeploy:lock"))
{
}

std::filesystem::path
DeploymentLock::get_lock_path() const
{
  return lock_path;
}

void
DeploymentLock::cancel()
{
  std::scoped_lock lock(mutex);
  cancelled = true;
  if (timer)
    {
      boost::asio::post(timer->get_executor(), [t = timer]() { t->cancel(); });
    }
}

bool
DeploymentLock::is_cancelled()
{
  std::scoped_lock lock(mutex);
  return cancelled;
}

boost::asio::awaitable<void>
DeploymentLock::sleep(std::shared_ptr<boost::asio::steady_timer> wait_timer, std::chrono::milliseconds duration)
{
  // Runs on the timer's strand, the same strand cancel() posts to.
  wait_timer->expires_after(duration);
  if (is_cancelled())
    {
      co_return;
    }

  boost::system::error_code ec;
  co_await wait_timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
}

outcome::std_result<bool>
DeploymentLock::try_lock(int fd)
{
  if (::flock(fd, LOCK_EX | LOCK_NB) == 0)
    {
      return true;
    }
  if (errno == EWOULDBLOCK || errno == EINTR)
    {
      return false;
    }

  logger->error("failed to lock {} ({})", lock_path.string(), std::strerror(errno));
  return DeployErrc::LockFailed;
}

std::optional<pid_t>
DeploymentLock::read_holder(int fd)
{
  char buffer[32];
  auto size = ::pread(fd, buffer, sizeof(buffer), 0);
  if (size <= 0)
    {
      return {};
    }
  return parse_pid(buffer, static_cast<std::size_t>(size));
}

std::optional<pid_t>
DeploymentLock::get_holder() const
{
  int fd = ::open(lock_path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0)
    {
      return {};
    }
  auto pid = read_holder(fd);
  ::close(fd);
  return pid;
}

boost::asio::awaitable<outcome::std_result<LockHandle>>
DeploymentLock::acquire(std::chrono::milliseconds timeout)
{
  int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0)
    {
      logger->error("failed to open lock file {} ({})", lock_path.string(), std::strerror(errno));
      co_return DeployErrc::LockFailed;
    }

  auto executor = co_await boost::asio::this_coro::executor;
  {
    std::scoped_lock lock(mutex);
    timer = std::make_shared<boost::asio::steady_timer>(boost::asio::make_strand(executor));
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  bool reported = false;
  outcome::std_result<void> result = outcome::success();

  while (true)
    {
      std::shared_ptr<boost::asio::steady_timer> wait_timer;
      {
        std::scoped_lock lock(mutex);
        if (cancelled)
          {
            logger->warn("wait for {} cancelled", lock_path.string());
            result = DeployErrc::LockCancelled;
            break;
          }
        wait_timer = timer;
      }

      auto locked = try_lock(fd);
      if (!locked)
        {
          result = locked.as_failure();
          break;
        }
      if (locked.value())
        {
          break;
        }

      if (!reported)
        {
          auto holder = read_holder(fd);
          logger->info("{} is held by process {}, waiting", lock_path.string(), holder ? std::to_string(*holder) : "unknown");
          reported = true;
        }

      auto now = std::chrono::steady_clock::now();
      if (now >= deadline)
        {
          logger->error("timeout waiting for {}", lock_path.string());
          result = DeployErrc::LockTimeout;
          break;
        }

      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
      co_await boost::asio::co_spawn(wait_timer->get_executor(),
                                     sleep(wait_timer, std::min(poll_interval, remaining)),
                                     boost::asio::use_awaitable);
    }

  {
    std::scoped_lock lock(mutex);
    timer.reset();
  }

  if (!result)
    {
      // Never acquired, so the holder's PID must stay in place.
      ::close(fd);
      co_return result.as_failure();
    }

  auto pid = std::to_string(::getpid()) + "\n";
  if (::ftruncate(fd, 0) != 0 || ::pwrite(fd, pid.data(), pid.size(), 0) < 0)
    {
      logger->warn("failed to record PID in {} ({})", lock_path.string(), std::strerror(errno));
    }

  logger->info("acquired {}", lock_path.string());
  co_return LockHandle(fd, lock_path);
}
