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

#include "StatusReporter.hh"

#include <utility>

#include <boost/json.hpp>

#include "ApiClient.hh"

using namespace sitedeploy;

StatusReporter::StatusReporter(std::shared_ptr<sitedeploy::http::IHttpClient> http,
                               std::string api_url,
                               std::string web_url,
                               std::string token,
                               LogCollector &collector)
  : http(std::move(http))
  , api_url(std::move(api_url))
  , web_url(std::move(web_url))
  , token(std::move(token))
  , logger(collector.create_logger("sitedeploy:status"))
{
}

std::string
StatusReporter::make_log_url(const DeploymentRequest &request) const
{
  return web_url + "/" + request.repository + "/commit/" + request.commit_sha + "/checks";
}

std::string
StatusReporter::truncate_description(std::string description)
{
  if (description.size() <= max_description_length)
    {
      return description;
    }

  auto length = max_description_length;
  while (length > 0 && (static_cast<unsigned char>(description[length]) & 0xC0) == 0x80)
    {
      length--;
    }
  description.resize(length);
  return description;
}

boost::asio::awaitable<void>
StatusReporter::report(const DeploymentRequest &request, DeploymentState state, std::string description)
{
  auto state_name = std::string(sitedeploy::utils::enum_to_string(state));
  description = truncate_description(std::move(description));

  boost::json::object body;
  body["state"] = state_name;
  body["environment"] = request.environment;
  body["environment_url"] = request.deploy_url;
  body["log_url"] = make_log_url(request);
  body["description"] = description;
  if (state == DeploymentState::Success)
    {
      body["auto_inactive"] = true;
    }

  ApiClient api(http, api_url, token, logger);
  auto rc = co_await api.post("/repos/" + request.repository + "/deployments/" + std::to_string(request.deployment_id) + "/statuses", body);
  if (!rc)
    {
      logger->warn("failed to report state {} for deployment {} ({})", state_name, request.deployment_id, rc.error().message());
      co_return;
    }
  if (rc.value().status != 201)
    {
      logger->warn("failed to report state {} for deployment {} ({} {})",
                   state_name,
                   request.deployment_id,
                   rc.value().status,
                   rc.value().text);
      co_return;
    }

  logger->info("deployment {} is {}", request.deployment_id, state_name);
}
