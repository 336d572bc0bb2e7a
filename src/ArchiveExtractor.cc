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

#include "ArchiveExtractor.hh"

#include <exception>
#include <thread>
#include <utility>

#include <boost/process.hpp>

#include "sitedeploy/SiteDeployErrors.hh"

using namespace sitedeploy;

ArchiveExtractor::ArchiveExtractor(LogCollector &collector, std::filesystem::path tar)
  : tar(std::move(tar))
  , logger(collector.create_logger("sitedeploy:archive"))
{
  if (this->tar.empty())
    {
      this->tar = boost::process::search_path("tar").string();
    }
}

boost::asio::awaitable<outcome::std_result<std::vector<std::string>>>
ArchiveExtractor::list(const std::filesystem::path &archive)
{
  co_return co_await boost::asio::async_compose<decltype(boost::asio::use_awaitable), void(outcome::std_result<std::vector<std::string>>)>(
    [this, archive](auto &&self) {
      std::thread([this, archive, self = std::move(self)]() mutable {
        auto result = run_list(archive);
        auto executor = self.get_executor();
        boost::asio::post(executor, [self = std::move(self), result = std::move(result)]() mutable { self.complete(std::move(result)); });
      }).detach();
    },
    boost::asio::use_awaitable);
}

boost::asio::awaitable<outcome::std_result<void>>
ArchiveExtractor::extract(const std::filesystem::path &archive, const std::filesystem::path &directory)
{
  co_return co_await boost::asio::async_compose<decltype(boost::asio::use_awaitable), void(outcome::std_result<void>)>(
    [this, archive, directory](auto &&self) {
      std::thread([this, archive, directory, self = std::move(self)]() mutable {
        auto result = run_extract(archive, directory);
        auto executor = self.get_executor();
        boost::asio::post(executor, [self = std::move(self), result]() mutable { self.complete(result); });
      }).detach();
    },
    boost::asio::use_awaitable);
}

outcome::std_result<std::vector<std::string>>
ArchiveExtractor::run_list(const std::filesystem::path &archive)
{
  if (tar.empty())
    {
      logger->error("tar not found");
      return DeployErrc::InternalError;
    }

  std::vector<std::string> entries;
  try
    {
      boost::process::ipstream out;
      boost::process::child child(tar.string(),
                                  "--list",
                                  "--file",
                                  archive.string(),
                                  boost::process::std_out > out,
                                  boost::process::std_err > boost::process::null);

      std::string line;
      while (std::getline(out, line))
        {
          if (!line.empty())
            {
              entries.push_back(line);
            }
        }
      child.wait();

      if (child.exit_code() != 0)
        {
          logger->error("{} is not a valid archive (tar exit status {})", archive.string(), child.exit_code());
          return DeployErrc::InvalidArchive;
        }
    }
  catch (std::exception &e)
    {
      logger->error("failed to list {} ({})", archive.string(), e.what());
      return DeployErrc::InvalidArchive;
    }

  if (entries.empty())
    {
      logger->error("archive {} is empty", archive.string());
      return DeployErrc::InvalidArchive;
    }

  logger->info("archive contains {} entries", entries.size());
  return entries;
}

outcome::std_result<void>
ArchiveExtractor::run_extract(const std::filesystem::path &archive, const std::filesystem::path &directory)
{
  if (tar.empty())
    {
      logger->error("tar not found");
      return DeployErrc::InternalError;
    }

  try
    {
      boost::process::ipstream err;
      boost::process::child child(tar.string(),
                                  "--extract",
                                  "--file",
                                  archive.string(),
                                  "--directory",
                                  directory.string(),
                                  "--no-same-owner",
                                  "--no-same-permissions",
                                  "--no-overwrite-dir",
                                  "--no-xattrs",
                                  "--no-acls",
                                  "--no-selinux",
                                  boost::process::std_out > boost::process::null,
                                  boost::process::std_err > err);

      std::string line;
      while (std::getline(err, line))
        {
          logger->warn("tar: {}", line);
        }
      child.wait();

      if (child.exit_code() != 0)
        {
          logger->error("failed to extract {} (tar exit status {})", archive.string(), child.exit_code());
          return DeployErrc::ExtractionFailed;
        }
    }
  catch (std::exception &e)
    {
      logger->error("failed to extract {} ({})", archive.string(), e.what());
      return DeployErrc::ExtractionFailed;
    }

  logger->info("extracted {} into {}", archive.string(), directory.string());
  return outcome::success();
}
