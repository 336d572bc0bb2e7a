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

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <thread>

#include <unistd.h>

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include "sitedeploy/SiteDeployErrors.hh"
#include "utils/IOContext.hh"
#include "utils/TempDirectory.hh"

#include "DeploymentLock.hh"
#include "LogCollector.hh"
#include "TestSupport.hh"

using namespace sitedeploy;
using namespace std::chrono_literals;

class DeploymentLockTest : public ::testing::Test
{
protected:
  outcome::std_result<LockHandle> acquire(DeploymentLock &lock, std::chrono::milliseconds timeout)
  {
    outcome::std_result<LockHandle> result = DeployErrc::InternalError;

    boost::asio::io_context ioc;
    boost::asio::co_spawn(
      ioc,
      [&]() -> boost::asio::awaitable<void> {
        try
          {
            result = co_await lock.acquire(timeout);
          }
        catch (std::exception &e)
          {
            spdlog::info("Exception {}", e.what());
            EXPECT_TRUE(false);
          }
      },
      boost::asio::detached);
    ioc.run();
    return result;
  }

protected:
  sitedeploy::utils::TempDirectory dir;
  std::filesystem::path webroot{dir.get_path() / "site"};
  LogCollector collector{nullptr, {}, "lock"};
};

TEST_F(DeploymentLockTest, acquire_records_pid)
{
  DeploymentLock lock(webroot, collector, 20ms);
  EXPECT_EQ(lock.get_lock_path(), dir.get_path() / "site.lock");
  EXPECT_FALSE(lock.get_holder().has_value());

  auto rc = acquire(lock, 1s);
  ASSERT_FALSE(rc.has_error());
  EXPECT_TRUE(rc.value().is_locked());
  EXPECT_EQ(lock.get_holder(), ::getpid());
  EXPECT_EQ(read_file(lock.get_lock_path()), std::to_string(::getpid()) + "\n");

  rc.value().release();
  EXPECT_FALSE(rc.value().is_locked());
  EXPECT_TRUE(std::filesystem::exists(lock.get_lock_path()));
  EXPECT_EQ(read_file(lock.get_lock_path()), "");
  EXPECT_FALSE(lock.get_holder().has_value());
}

TEST_F(DeploymentLockTest, exclusive)
{
  DeploymentLock first(webroot, collector, 20ms);
  DeploymentLock second(webroot, collector, 20ms);

  auto held = acquire(first, 1s);
  ASSERT_FALSE(held.has_error());

  auto start = std::chrono::steady_clock::now();
  auto rc = acquire(second, 200ms);
  auto elapsed = std::chrono::steady_clock::now() - start;
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), DeployErrc::LockTimeout);
  EXPECT_GE(elapsed, 200ms);
  EXPECT_LT(elapsed, 5s);

  // The waiter leaves the holder's PID in place.
  EXPECT_EQ(second.get_holder(), ::getpid());

  held.value().release();
  rc = acquire(second, 200ms);
  EXPECT_FALSE(rc.has_error());
}

TEST_F(DeploymentLockTest, released_on_destruction)
{
  DeploymentLock first(webroot, collector, 20ms);
  DeploymentLock second(webroot, collector, 20ms);

  {
    auto held = acquire(first, 1s);
    ASSERT_FALSE(held.has_error());
  }

  auto rc = acquire(second, 100ms);
  EXPECT_FALSE(rc.has_error());
}

TEST_F(DeploymentLockTest, waiter_acquires_after_release)
{
  DeploymentLock first(webroot, collector, 20ms);
  DeploymentLock second(webroot, collector, 20ms);

  auto held = acquire(first, 1s);
  ASSERT_FALSE(held.has_error());

  std::optional<outcome::std_result<LockHandle>> result;

  boost::asio::io_context ioc;
  boost::asio::steady_timer timer(ioc, 100ms);
  timer.async_wait([&](const boost::system::error_code &) { held.value().release(); });
  boost::asio::co_spawn(
    ioc,
    [&]() -> boost::asio::awaitable<void> { result = co_await second.acquire(5s); },
    boost::asio::detached);
  ioc.run();

  ASSERT_TRUE(result.has_value());
  ASSERT_FALSE(result->has_error());
  EXPECT_TRUE(result->value().is_locked());
}

TEST_F(DeploymentLockTest, cancel_pending_wait)
{
  DeploymentLock first(webroot, collector, 20ms);
  DeploymentLock second(webroot, collector, 10s);

  auto held = acquire(first, 1s);
  ASSERT_FALSE(held.has_error());

  std::optional<outcome::std_result<LockHandle>> result;

  auto start = std::chrono::steady_clock::now();
  boost::asio::io_context ioc;
  boost::asio::steady_timer timer(ioc, 100ms);
  timer.async_wait([&](const boost::system::error_code &) { second.cancel(); });
  boost::asio::co_spawn(
    ioc,
    [&]() -> boost::asio::awaitable<void> { result = co_await second.acquire(60s); },
    boost::asio::detached);
  ioc.run();
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->has_error());
  EXPECT_EQ(result->error(), DeployErrc::LockCancelled);
  EXPECT_LT(elapsed, 5s);
  EXPECT_EQ(first.get_holder(), ::getpid());
}

TEST_F(DeploymentLockTest, cancel_pending_wait_on_worker_pool)
{
  DeploymentLock first(webroot, collector, 20ms);
  auto held = acquire(first, 1s);
  ASSERT_FALSE(held.has_error());

  sitedeploy::utils::IOContext workers{4};

  for (int i = 0; i < 100; i++)
    {
      DeploymentLock waiter(webroot, collector, 1ms);
      auto promise = std::make_shared<std::promise<outcome::std_result<LockHandle>>>();
      auto future = promise->get_future();

      boost::asio::co_spawn(
        workers.get_io_context(),
        [&waiter, promise]() -> boost::asio::awaitable<void> {
          try
            {
              promise->set_value(co_await waiter.acquire(5s));
            }
          catch (std::exception &e)
            {
              spdlog::info("Exception {}", e.what());
              EXPECT_TRUE(false);
              promise->set_value(DeployErrc::InternalError);
            }
        },
        boost::asio::detached);

      std::this_thread::sleep_for(std::chrono::microseconds(100 * (i % 20)));
      waiter.cancel();

      ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
      auto rc = future.get();
      ASSERT_TRUE(rc.has_error());
      EXPECT_EQ(rc.error(), DeployErrc::LockCancelled);
    }

  EXPECT_EQ(first.get_holder(), ::getpid());
}

TEST_F(DeploymentLockTest, cancel_before_acquire)
{
  DeploymentLock lock(webroot, collector, 20ms);
  lock.cancel();

  auto rc = acquire(lock, 1s);
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), DeployErrc::LockCancelled);
}

TEST_F(DeploymentLockTest, missing_directory)
{
  DeploymentLock lock(dir.get_path() / "missing" / "site", collector, 20ms);

  auto rc = acquire(lock, 100ms);
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), DeployErrc::LockFailed);
}
