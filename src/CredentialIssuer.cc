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

#include "CredentialIssuer.hh"

#include <utility>

#include <boost/json.hpp>
#include <boost/outcome/try.hpp>

#include "sitedeploy/SiteDeployErrors.hh"

#include "ApiClient.hh"

using namespace sitedeploy;

CredentialIssuer::CredentialIssuer(std::shared_ptr<sitedeploy::http::IHttpClient> http,
                                   std::string api_url,
                                   std::string client_id,
                                   std::shared_ptr<sitedeploy::utils::TimeSource> time_source)
  : http(std::move(http))
  , api_url(std::move(api_url))
  , client_id(std::move(client_id))
  , time_source(std::move(time_source))
{
}

outcome::std_result<void>
CredentialIssuer::set_private_key(const std::string &private_key)
{
  auto rc = signer.set_key(private_key);
  if (!rc)
    {
      logger->error("failed to load application private key ({})", rc.error().message());
    }
  return rc;
}

outcome::std_result<std::string>
CredentialIssuer::create_jwt() const
{
  auto now = std::chrono::duration_cast<std::chrono::seconds>(time_source->now().time_since_epoch());

  boost::json::object claims;
  claims["iat"] = (now - clock_skew).count();
  claims["exp"] = (now + validity).count();
  claims["iss"] = client_id;

  return signer.sign(boost::json::serialize(claims));
}

boost::asio::awaitable<outcome::std_result<std::string>>
CredentialIssuer::issue(const std::string &repository)
{
  auto jwt = create_jwt();
  if (!jwt)
    {
      logger->error("failed to create application token ({})", jwt.error().message());
      co_return DeployErrc::CredentialsUnavailable;
    }

  BOOST_OUTCOME_CO_TRY(auto installation_id, co_await lookup_installation(repository, jwt.value()));
  BOOST_OUTCOME_CO_TRY(auto token, co_await create_access_token(installation_id, repository, jwt.value()));

  logger->info("obtained installation token for {}", repository);
  co_return token;
}

boost::asio::awaitable<outcome::std_result<std::int64_t>>
CredentialIssuer::lookup_installation(const std::string &repository, const std::string &jwt)
{
  ApiClient api(http, api_url, jwt, logger);

  auto rc = co_await api.get("/repos/" + repository + "/installation");
  if (!rc)
    {
      co_return DeployErrc::CredentialsUnavailable;
    }

  const auto &response = rc.value();
  if (response.status != 200 || !response.json.is_object())
    {
      logger->error("installation lookup for {} failed ({} {})", repository, response.status, response.text);
      co_return DeployErrc::CredentialsUnavailable;
    }

  const auto *id = response.json.as_object().if_contains("id");
  if (id == nullptr || !id->is_int64())
    {
      logger->error("installation lookup for {} returned no id", repository);
      co_return DeployErrc::CredentialsUnavailable;
    }
  co_return id->as_int64();
}

boost::asio::awaitable<outcome::std_result<std::string>>
CredentialIssuer::create_access_token(std::int64_t installation_id, const std::string &repository, const std::string &jwt)
{
  ApiClient api(http, api_url, jwt, logger);

  auto name = repository.substr(repository.find('/') + 1);
  boost::json::object body;
  body["repositories"] = boost::json::array{boost::json::value(name)};

  auto rc = co_await api.post("/app/installations/" + std::to_string(installation_id) + "/access_tokens", body);
  if (!rc)
    {
      co_return DeployErrc::CredentialsUnavailable;
    }

  const auto &response = rc.value();
  if (response.status != 201 || !response.json.is_object())
    {
      logger->error("token request for installation {} failed ({} {})", installation_id, response.status, response.text);
      co_return DeployErrc::CredentialsUnavailable;
    }

  const auto *token = response.json.as_object().if_contains("token");
  if (token == nullptr || !token->is_string() || token->as_string().empty())
    {
      logger->error("token request for installation {} returned no token", installation_id);
      co_return DeployErrc::CredentialsUnavailable;
    }
  co_return std::string(token->as_string());
}
