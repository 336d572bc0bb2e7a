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

#include "DeploymentManager.hh"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <boost/outcome/try.hpp>

#include "sitedeploy/SiteDeployErrors.hh"
#include "utils/DateUtils.hh"
#include "utils/TempDirectory.hh"

#include "FieldValidators.hh"

using namespace sitedeploy;

namespace
{
  // True if `path` lies below `base` and is not `base` itself.
  bool is_strictly_inside(const std::filesystem::path &path, const std::filesystem::path &base)
  {
    auto relative = path.lexically_relative(base);
    if (relative.empty() || relative == ".")
      {
        return false;
      }
    return *relative.begin() != "..";
  }
} // namespace

DeploymentManager::DeploymentManager(DeploymentRequest request,
                                     DeploymentSettings settings,
                                     std::shared_ptr<sitedeploy::http::IHttpClient> http,
                                     std::shared_ptr<sitedeploy::http::IHttpClient> status_http,
                                     LogCollector &collector,
                                     std::shared_ptr<sitedeploy::utils::TimeSource> time_source)
  : request(std::move(request))
  , settings(std::move(settings))
  , base_dir(this->request.webroot.parent_path())
  , time_source(std::move(time_source))
  , logger(collector.create_logger("sitedeploy:deploy"))
  , lock(this->request.webroot, collector, this->settings.lock_poll_interval)
  , fetcher(http, this->settings.api_url, this->settings.token, this->settings.deployment_key, collector)
  , extractor(collector)
  , reporter(std::move(status_http), this->settings.api_url, this->settings.web_url, this->settings.token, collector)
  , pruner(http, this->settings.api_url, this->settings.token, collector)
{
}

const DeploymentRequest &
DeploymentManager::get_request() const
{
  return request;
}

void
DeploymentManager::cancel()
{
  lock.cancel();
}

std::string
DeploymentManager::make_version_name() const
{
  auto timestamp = sitedeploy::utils::DateUtils::format_time_point(time_source->now(), "%Y%m%d%H%M%S");
  return timestamp + "_" + request.commit_sha + "_" + std::to_string(request.deployment_id);
}

boost::asio::awaitable<outcome::std_result<void>>
DeploymentManager::deploy()
{
  logger->info("deploying {}@{} to {} ({})", request.repository, request.commit_sha, request.environment, request.webroot.string());
  for (const auto &author: request.authors)
    {
      logger->info("author: {} <{}>", author.name, author.email);
    }

  co_await reporter.report(request, DeploymentState::Queued, "Deployment queued");

  outcome::std_result<void> rc = outcome::success();
  auto lock_rc = co_await lock.acquire(settings.lock_timeout);
  if (!lock_rc)
    {
      rc = lock_rc.as_failure();
    }
  else
    {
      LockHandle handle = std::move(lock_rc.value());
      co_await reporter.report(request, DeploymentState::InProgress, "Deployment in progress");
      rc = co_await install();
      handle.release();
    }

  if (!rc)
    {
      logger->error("deployment {} failed ({})", request.deployment_id, rc.error().message());
      co_await reporter.report(request, DeploymentState::Failure, "Deployment failed: " + rc.error().message());
      co_return rc;
    }

  logger->info("deployment {} succeeded", request.deployment_id);
  co_await reporter.report(request, DeploymentState::Success, "Deployment succeeded");
  co_await prune();
  co_return outcome::success();
}

boost::asio::awaitable<outcome::std_result<void>>
DeploymentManager::install()
{
  BOOST_OUTCOME_CO_TRY(auto previous, resolve_previous());

  auto version_dir = base_dir / make_version_name();
  std::error_code ec;
  if (std::filesystem::exists(std::filesystem::symlink_status(version_dir, ec)))
    {
      logger->error("version directory {} already exists", version_dir.string());
      co_return DeployErrc::ExtractionFailed;
    }

  BOOST_OUTCOME_CO_TRY(auto artifact, co_await fetcher.fetch(request.artifact, base_dir));
  BOOST_OUTCOME_CO_TRYV(co_await extractor.list(artifact->get_path()));

  if (!std::filesystem::create_directory(version_dir, ec) || ec)
    {
      logger->error("failed to create {} ({})", version_dir.string(), ec.message());
      co_return DeployErrc::ExtractionFailed;
    }

  auto extract_rc = co_await extractor.extract(artifact->get_path(), version_dir);
  artifact.reset();
  if (!extract_rc)
    {
      std::filesystem::remove_all(version_dir, ec);
      co_return extract_rc.as_failure();
    }

  auto publish_rc = publish(version_dir);
  if (!publish_rc)
    {
      std::filesystem::remove_all(version_dir, ec);
      co_return publish_rc.as_failure();
    }

  if (previous)
    {
      if (publish_rc.value())
        {
          remove_previous(*previous, version_dir);
        }
      else
        {
          logger->warn("keeping previous version {}, the new link may not be durable", previous->string());
        }
    }
  co_return outcome::success();
}

outcome::std_result<std::optional<std::filesystem::path>>
DeploymentManager::resolve_previous() const
{
  std::error_code ec;
  auto status = std::filesystem::symlink_status(request.webroot, ec);
  if (status.type() == std::filesystem::file_type::not_found)
    {
      logger->info("{} does not exist yet", request.webroot.string());
      return std::optional<std::filesystem::path>{};
    }
  if (ec)
    {
      logger->error("failed to inspect {} ({})", request.webroot.string(), ec.message());
      return DeployErrc::SwapFailed;
    }
  if (!std::filesystem::is_symlink(status))
    {
      logger->critical("{} exists but is not a symbolic link, manual intervention required", request.webroot.string());
      return DeployErrc::WebrootNotSymlink;
    }

  auto target = std::filesystem::read_symlink(request.webroot, ec);
  if (ec)
    {
      logger->error("failed to read {} ({})", request.webroot.string(), ec.message());
      return DeployErrc::SwapFailed;
    }
  if (target.is_relative())
    {
      target = base_dir / target;
    }

  logger->info("current version is {}", target.string());
  return std::optional<std::filesystem::path>{target.lexically_normal()};
}

outcome::std_result<bool>
DeploymentManager::publish(const std::filesystem::path &version_dir)
{
  auto temp_link = base_dir / ("." + request.webroot.filename().string() + ".new-" + sitedeploy::utils::TempDirectory::generate_random_string(10));

  std::error_code ec;
  std::filesystem::create_directory_symlink(version_dir.filename(), temp_link, ec);
  if (ec)
    {
      logger->error("failed to create {} ({})", temp_link.string(), ec.message());
      return DeployErrc::SwapFailed;
    }

  std::filesystem::rename(temp_link, request.webroot, ec);
  if (ec)
    {
      logger->error("failed to replace {} ({})", request.webroot.string(), ec.message());
      std::error_code ignored;
      std::filesystem::remove(temp_link, ignored);
      return DeployErrc::SwapFailed;
    }

  logger->info("{} now points to {}", request.webroot.string(), version_dir.filename().string());
  return sync_directory(base_dir);
}

bool
DeploymentManager::sync_directory(const std::filesystem::path &directory)
{
  int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0)
    {
      logger->warn("failed to open {} ({})", directory.string(), std::strerror(errno));
      return false;
    }

  bool synced = ::fsync(fd) == 0;
  if (!synced)
    {
      logger->warn("failed to sync {} ({})", directory.string(), std::strerror(errno));
    }
  ::close(fd);
  return synced;
}

void
DeploymentManager::remove_previous(const std::filesystem::path &previous, const std::filesystem::path &version_dir)
{
  std::error_code ec;
  auto canonical_base = std::filesystem::canonical(base_dir, ec);
  if (ec)
    {
      logger->warn("failed to resolve {} ({}), keeping previous version", base_dir.string(), ec.message());
      return;
    }

  auto canonical_previous = std::filesystem::canonical(previous, ec);
  if (ec)
    {
      logger->warn("previous version {} no longer exists", previous.string());
      return;
    }

  auto canonical_version = std::filesystem::canonical(version_dir, ec);
  if (ec || canonical_previous == canonical_version)
    {
      logger->warn("previous version {} is the new version, keeping it", canonical_previous.string());
      return;
    }

  if (!is_strictly_inside(canonical_previous, canonical_base))
    {
      logger->warn("previous version {} is outside {}, not removing it", canonical_previous.string(), canonical_base.string());
      return;
    }

  std::filesystem::remove_all(canonical_previous, ec);
  if (ec)
    {
      logger->warn("failed to remove previous version {} ({})", canonical_previous.string(), ec.message());
      return;
    }
  logger->info("removed previous version {}", canonical_previous.string());
}

boost::asio::awaitable<void>
DeploymentManager::prune()
{
  auto asset_id = FieldValidators::parse_artifact_url(request.artifact.url, settings.api_url, request.repository);
  if (!asset_id)
    {
      logger->warn("cannot determine asset id of {}, skipping pruning", request.artifact.url);
      co_return;
    }

  auto rc = co_await pruner.prune(request.repository, request.environment, *asset_id);
  if (!rc)
    {
      logger->warn("failed to prune old artifacts ({})", rc.error().message());
      co_return;
    }
  logger->info("pruned {} old artifacts", rc.value());
}
