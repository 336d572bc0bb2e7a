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

#include "WebhookService.hh"

#include <utility>

#include <fmt/format.h>

#include "sitedeploy/SiteDeployErrors.hh"

#include "LogCollector.hh"

using namespace sitedeploy;
namespace beast_http = boost::beast::http;

namespace
{
  constexpr std::chrono::milliseconds poll_step{10};

  std::string header_value(const sitedeploy::http::ServerRequest &request, boost::beast::string_view name)
  {
    auto it = request.find(name);
    if (it == request.end())
      {
        return {};
      }
    return std::string(it->value());
  }
} // namespace

WebhookService::WebhookService(std::shared_ptr<const Configuration> config,
                               std::shared_ptr<sitedeploy::http::IHttpClient> http,
                               std::shared_ptr<sitedeploy::http::IHttpClient> status_http,
                               std::shared_ptr<MailTransport> transport,
                               sitedeploy::utils::IOContext &workers)
  : config(config)
  , http(http)
  , status_http(std::move(status_http))
  , transport(std::move(transport))
  , workers(workers)
  , validator(config)
  , issuer(http, config->api_url, config->app.client_id)
{
}

outcome::std_result<void>
WebhookService::init()
{
  auto rc = issuer.set_private_key(config->app.private_key);
  if (!rc)
    {
      logger->error("failed to load application private key ({})", rc.error().message());
      return rc.as_failure();
    }
  logger->info("serving {} repositories", config->repositories.size());
  return outcome::success();
}

void
WebhookService::set_startup_grace(std::chrono::milliseconds grace)
{
  startup_grace = grace;
}

void
WebhookService::set_lock_timeout(std::chrono::milliseconds timeout)
{
  lock_timeout = timeout;
}

void
WebhookService::set_time_source(std::shared_ptr<sitedeploy::utils::TimeSource> time_source)
{
  this->time_source = std::move(time_source);
}

std::size_t
WebhookService::get_active_count() const
{
  std::scoped_lock lock(mutex);
  return active.size();
}

void
WebhookService::shutdown()
{
  std::scoped_lock lock(mutex);
  stopping = true;
  for (auto &weak_manager: active)
    {
      if (auto manager = weak_manager.lock())
        {
          logger->info("cancelling deployment {}", manager->get_request().deployment_id);
          manager->cancel();
        }
    }
}

boost::asio::awaitable<sitedeploy::http::ServerResponse>
WebhookService::handle(sitedeploy::http::ServerRequest request)
{
  {
    std::scoped_lock lock(mutex);
    if (stopping)
      {
        co_return sitedeploy::http::make_text_response(beast_http::status::service_unavailable, "shutting down");
      }
  }

  WebhookRequest webhook;
  webhook.method = std::string(request.method_string());
  webhook.content_type = header_value(request, "Content-Type");
  webhook.signature = header_value(request, "X-Hub-Signature-256");
  webhook.event = header_value(request, "X-GitHub-Event");
  webhook.body = std::move(request.body());

  auto rc = validator.validate(webhook);
  if (!rc)
    {
      auto status = http_status(rc.error());
      logger->info("rejected webhook: {} ({})", rc.error().message(), status);
      co_return sitedeploy::http::make_text_response(static_cast<beast_http::status>(status), rc.error().message());
    }

  if (auto *ignored = std::get_if<IgnoredEvent>(&rc.value()))
    {
      logger->info("{}", ignored->reason);
      co_return sitedeploy::http::make_text_response(beast_http::status::ok, ignored->reason);
    }

  auto deployment = std::get<DeploymentRequest>(std::move(rc.value()));
  auto token = co_await issuer.issue(deployment.repository);
  if (!token)
    {
      logger->error("no credentials for {} ({})", deployment.repository, token.error().message());
      co_return sitedeploy::http::make_text_response(beast_http::status::internal_server_error, token.error().message());
    }

  co_return co_await dispatch(std::move(deployment), std::move(token.value()));
}

boost::asio::awaitable<sitedeploy::http::ServerResponse>
WebhookService::dispatch(DeploymentRequest request, std::string token)
{
  auto deployment_id = request.deployment_id;
  auto state = std::make_shared<DispatchState>();
  auto self = shared_from_this();

  boost::asio::co_spawn(
    boost::asio::make_strand(workers.get_io_context()),
    [self, state, request = std::move(request), token = std::move(token)]() mutable -> boost::asio::awaitable<void> {
      outcome::std_result<void> rc = outcome::success();
      try
        {
          rc = co_await self->run_deployment(std::move(request), std::move(token));
        }
      catch (std::exception &e)
        {
          self->logger->error("deployment aborted ({})", e.what());
          rc = DeployErrc::InternalError;
        }
      std::scoped_lock lock(state->mutex);
      state->result = rc;
    },
    boost::asio::detached);

  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::steady_timer timer(executor);
  auto deadline = std::chrono::steady_clock::now() + startup_grace;

  for (;;)
    {
      {
        std::scoped_lock lock(state->mutex);
        if (state->result)
          {
            if (!*state->result)
              {
                co_return sitedeploy::http::make_text_response(beast_http::status::internal_server_error,
                                                               state->result->error().message());
              }
            co_return sitedeploy::http::make_text_response(beast_http::status::ok,
                                                           fmt::format("deployment {} succeeded", deployment_id));
          }
      }

      auto now = std::chrono::steady_clock::now();
      if (now >= deadline)
        {
          break;
        }

      timer.expires_after(std::min<std::chrono::steady_clock::duration>(poll_step, deadline - now));
      boost::system::error_code ec;
      co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

  logger->info("deployment {} continues in the background", deployment_id);
  co_return sitedeploy::http::make_text_response(beast_http::status::accepted, fmt::format("deployment {} accepted", deployment_id));
}

boost::asio::awaitable<outcome::std_result<void>>
WebhookService::run_deployment(DeploymentRequest request, std::string token)
{
  auto description = fmt::format("[sitedeploy] {} {} deployment {}", request.repository, request.environment, request.deployment_id);
  LogCollector collector(transport, request.log_recipients, description);

  DeploymentSettings settings;
  settings.api_url = config->api_url;
  settings.web_url = config->web_url;
  settings.token = std::move(token);
  settings.deployment_key = config->deployment_key;
  settings.lock_timeout = lock_timeout;

  auto manager = std::make_shared<DeploymentManager>(std::move(request), std::move(settings), http, status_http, collector, time_source);

  std::list<std::weak_ptr<DeploymentManager>>::iterator registration;
  {
    std::scoped_lock lock(mutex);
    registration = active.insert(active.end(), manager);
    if (stopping)
      {
        manager->cancel();
      }
  }

  outcome::std_result<void> rc = outcome::success();
  try
    {
      rc = co_await manager->deploy();
    }
  catch (std::exception &e)
    {
      logger->error("deployment {} aborted ({})", manager->get_request().deployment_id, e.what());
      rc = DeployErrc::InternalError;
    }

  {
    std::scoped_lock lock(mutex);
    active.erase(registration);
  }

  collector.flush(rc.has_value());
  co_return rc;
}
