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

#ifndef WEBHOOK_SERVICE_HH
#define WEBHOOK_SERVICE_HH

#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio.hpp>
#include <boost/outcome/std_result.hpp>

#include "http/HttpClient.hh"
#include "http/HttpServer.hh"
#include "sitedeploy/Configuration.hh"
#include "sitedeploy/DeploymentRequest.hh"
#include "utils/IOContext.hh"
#include "utils/Logging.hh"

#include "CredentialIssuer.hh"
#include "DeploymentManager.hh"
#include "MailTransport.hh"
#include "WebhookValidator.hh"

namespace outcome = boost::outcome_v2;

// Receives deployment webhooks and runs the requested deployments on a worker pool.
class WebhookService : public std::enable_shared_from_this<WebhookService>
{
public:
  WebhookService(std::shared_ptr<const sitedeploy::Configuration> config,
                 std::shared_ptr<sitedeploy::http::IHttpClient> http,
                 std::shared_ptr<sitedeploy::http::IHttpClient> status_http,
                 std::shared_ptr<MailTransport> transport,
                 sitedeploy::utils::IOContext &workers);

  WebhookService(const WebhookService &) = delete;
  WebhookService &operator=(const WebhookService &) = delete;
  WebhookService(WebhookService &&) = delete;
  WebhookService &operator=(WebhookService &&) = delete;

  outcome::std_result<void> init();

  boost::asio::awaitable<sitedeploy::http::ServerResponse> handle(sitedeploy::http::ServerRequest request);

  // Rejects new webhooks and abandons deployments still waiting for their lock.
  void shutdown();

  void set_startup_grace(std::chrono::milliseconds grace);
  void set_lock_timeout(std::chrono::milliseconds timeout);
  void set_time_source(std::shared_ptr<sitedeploy::utils::TimeSource> time_source);

  std::size_t get_active_count() const;

  static constexpr std::chrono::milliseconds default_startup_grace{500};

private:
  boost::asio::awaitable<sitedeploy::http::ServerResponse> dispatch(sitedeploy::DeploymentRequest request, std::string token);
  boost::asio::awaitable<outcome::std_result<void>> run_deployment(sitedeploy::DeploymentRequest request, std::string token);

  struct DispatchState
  {
    std::mutex mutex;
    std::optional<outcome::std_result<void>> result;
  };

private:
  std::shared_ptr<const sitedeploy::Configuration> config;
  std::shared_ptr<sitedeploy::http::IHttpClient> http;
  std::shared_ptr<sitedeploy::http::IHttpClient> status_http;
  std::shared_ptr<MailTransport> transport;
  sitedeploy::utils::IOContext &workers;
  WebhookValidator validator;
  CredentialIssuer issuer;
  std::shared_ptr<sitedeploy::utils::TimeSource> time_source{std::make_shared<sitedeploy::utils::RealTimeSource>()};
  std::chrono::milliseconds startup_grace{default_startup_grace};
  std::chrono::milliseconds lock_timeout{std::chrono::seconds{300}};
  mutable std::mutex mutex;
  bool stopping{false};
  std::list<std::weak_ptr<DeploymentManager>> active;
  std::shared_ptr<spdlog::logger> logger{sitedeploy::utils::Logging::create("sitedeploy:service")};
};

#endif // WEBHOOK_SERVICE_HH
