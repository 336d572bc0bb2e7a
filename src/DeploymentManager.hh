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

#ifndef DEPLOYMENT_MANAGER_HH
#define DEPLOYMENT_MANAGER_HH

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <boost/outcome/std_result.hpp>

#include "http/HttpClient.hh"
#include "sitedeploy/DeploymentRequest.hh"
#include "utils/TimeSource.hh"

#include "ArchiveExtractor.hh"
#include "ArtifactFetcher.hh"
#include "DeploymentLock.hh"
#include "LogCollector.hh"
#include "RetentionPruner.hh"
#include "StatusReporter.hh"

namespace outcome = boost::outcome_v2;

struct DeploymentSettings
{
  std::string api_url;
  std::string web_url;
  std::string token;
  std::string deployment_key;
  std::chrono::milliseconds lock_timeout{std::chrono::seconds{300}};
  std::chrono::milliseconds lock_poll_interval{DeploymentLock::default_poll_interval};
};

// Publishes one artifact to one webroot: QUEUED -> IN_PROGRESS -> SUCCESS | FAILURE.
class DeploymentManager
{
public:
  DeploymentManager(sitedeploy::DeploymentRequest request,
                    DeploymentSettings settings,
                    std::shared_ptr<sitedeploy::http::IHttpClient> http,
                    std::shared_ptr<sitedeploy::http::IHttpClient> status_http,
                    LogCollector &collector,
                    std::shared_ptr<sitedeploy::utils::TimeSource> time_source = std::make_shared<sitedeploy::utils::RealTimeSource>());

  boost::asio::awaitable<outcome::std_result<void>> deploy();

  // Abandons a pending wait for the deployment lock.
  void cancel();

  // Name of the version directory: {UTC timestamp}_{commit sha}_{deployment id}.
  std::string make_version_name() const;

  const sitedeploy::DeploymentRequest &get_request() const;

private:
  boost::asio::awaitable<outcome::std_result<void>> install();
  outcome::std_result<std::optional<std::filesystem::path>> resolve_previous() const;
  outcome::std_result<bool> publish(const std::filesystem::path &version_dir);
  void remove_previous(const std::filesystem::path &previous, const std::filesystem::path &version_dir);
  bool sync_directory(const std::filesystem::path &directory);
  boost::asio::awaitable<void> prune();

private:
  const sitedeploy::DeploymentRequest request;
  const DeploymentSettings settings;
  const std::filesystem::path base_dir;
  std::shared_ptr<sitedeploy::utils::TimeSource> time_source;
  std::shared_ptr<spdlog::logger> logger;
  DeploymentLock lock;
  ArtifactFetcher fetcher;
  ArchiveExtractor extractor;
  StatusReporter reporter;
  RetentionPruner pruner;
};

#endif // DEPLOYMENT_MANAGER_HH
