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

#include "WebhookValidator.hh"

#include <algorithm>
#include <initializer_list>
#include <limits>
#include <utility>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/outcome/try.hpp>

#include "sitedeploy/SiteDeployErrors.hh"

#include "FieldValidators.hh"

using namespace sitedeploy;

namespace
{
  const boost::json::object *find_object(const boost::json::object &obj, std::string_view key)
  {
    const auto *val = obj.if_contains(key);
    if (val == nullptr || !val->is_object())
      {
        return nullptr;
      }
    return &val->as_object();
  }

  std::optional<std::string> find_string(const boost::json::object &obj, std::string_view key)
  {
    const auto *val = obj.if_contains(key);
    if (val == nullptr || !val->is_string())
      {
        return {};
      }
    return std::string(val->as_string());
  }

  std::optional<std::int64_t> find_integer(const boost::json::object &obj, std::string_view key)
  {
    const auto *val = obj.if_contains(key);
    if (val == nullptr)
      {
        return {};
      }
    if (val->is_int64())
      {
        return val->as_int64();
      }
    if (val->is_uint64() && val->as_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
      {
        return static_cast<std::int64_t>(val->as_uint64());
      }
    return {};
  }

  bool is_json_media_type(const std::string &content_type)
  {
    std::string media_type = content_type.substr(0, content_type.find(';'));
    boost::algorithm::trim(media_type);
    return boost::algorithm::iequals(media_type, "application/json");
  }
} // namespace

WebhookValidator::WebhookValidator(std::shared_ptr<const Configuration> config)
  : config(std::move(config))
  , verifier(collect_secrets(*this->config))
{
}

std::map<std::string, std::string>
WebhookValidator::collect_secrets(const Configuration &config)
{
  std::map<std::string, std::string> secrets;
  for (const auto &[name, repository]: config.repositories)
    {
      secrets.emplace(name, repository.secret);
    }
  return secrets;
}

outcome::std_result<WebhookResult>
WebhookValidator::validate(const WebhookRequest &request) const
{
  BOOST_OUTCOME_TRYV(check_transport(request));
  BOOST_OUTCOME_TRY(auto identities, verifier.verify(request.body, request.signature));

  boost::json::error_code ec;
  boost::json::value root = boost::json::parse(request.body, ec);
  if (ec || !root.is_object())
    {
      logger->warn("malformed JSON in request body ({})", ec ? ec.message() : "not an object");
      return WebhookErrc::MalformedJson;
    }

  if (request.event != deployment_status_event)
    {
      logger->info("ignoring '{}' event", request.event);
      return WebhookResult{IgnoredEvent{"event '" + request.event + "' ignored"}};
    }

  const auto &event = root.as_object();
  BOOST_OUTCOME_TRY(auto repository, check_repository(event, identities));

  const auto *deployment = find_object(event, "deployment");
  const auto *status = find_object(event, "deployment_status");
  if (deployment == nullptr || status == nullptr)
    {
      logger->warn("event lacks deployment or deployment status");
      return WebhookErrc::InvalidPayload;
    }

  auto environment_name = find_string(*deployment, "environment").value_or("");
  auto environment_it = repository->environments.find(environment_name);
  if (environment_it == repository->environments.end())
    {
      logger->warn("unknown environment '{}' for {}", environment_name, repository->name);
      return WebhookErrc::UnknownEnvironment;
    }
  const auto &environment = environment_it->second;

  auto task = find_string(*deployment, "task").value_or("");
  if (task != "deploy")
    {
      logger->warn("unsupported deployment task '{}'", task);
      return WebhookErrc::InvalidTask;
    }

  auto deployment_id = find_integer(*deployment, "id");
  if (!deployment_id || *deployment_id <= 0)
    {
      logger->warn("missing or invalid deployment id");
      return WebhookErrc::InvalidDeploymentId;
    }

  auto sha = find_string(*deployment, "sha").value_or("");
  if (!FieldValidators::is_commit_sha(sha))
    {
      logger->warn("invalid commit SHA '{}'", sha);
      return WebhookErrc::InvalidCommitSha;
    }

  auto status_environment = find_string(*status, "environment").value_or("");
  if (status_environment != environment_name)
    {
      logger->warn("deployment status environment '{}' does not match '{}'", status_environment, environment_name);
      return WebhookErrc::EnvironmentMismatch;
    }

  auto state = find_string(*status, "state").value_or("");
  if (state != "pending")
    {
      logger->info("ignoring deployment {} in state '{}'", *deployment_id, state);
      return WebhookResult{IgnoredEvent{"deployment status '" + state + "' ignored"}};
    }

  BOOST_OUTCOME_TRY(auto payload, parse_payload(*deployment));

  DeploymentRequest result;
  result.repository = repository->name;
  result.environment = environment_name;
  result.deployment_id = *deployment_id;
  result.commit_sha = sha;
  result.deploy_url = environment.deploy_url;
  result.webroot = environment.webroot;

  BOOST_OUTCOME_TRYV(check_artifact(result, payload));
  collect_people(result, payload);
  result.log_recipients = merge_recipients(*repository, environment, result.pusher);

  logger->info("accepted deployment {} of {}@{} to {}", result.deployment_id, result.repository, result.commit_sha, result.environment);
  return WebhookResult{std::move(result)};
}

outcome::std_result<void>
WebhookValidator::check_transport(const WebhookRequest &request) const
{
  if (request.method != "POST")
    {
      logger->warn("unsupported method {}", request.method);
      return WebhookErrc::MethodNotAllowed;
    }

  if (!is_json_media_type(request.content_type))
    {
      logger->warn("unsupported content type '{}'", request.content_type);
      return WebhookErrc::UnsupportedMediaType;
    }
  return outcome::success();
}

outcome::std_result<const RepositoryIdentity *>
WebhookValidator::check_repository(const boost::json::object &event, const std::vector<std::string> &identities) const
{
  std::string name;
  if (const auto *repository = find_object(event, "repository"); repository != nullptr)
    {
      name = find_string(*repository, "full_name").value_or("");
    }

  auto it = config->repositories.find(name);
  if (it == config->repositories.end())
    {
      logger->warn("unknown repository '{}'", name);
      return WebhookErrc::UnknownRepository;
    }

  if (std::find(identities.begin(), identities.end(), name) == identities.end())
    {
      logger->warn("signature does not belong to repository '{}'", name);
      return WebhookErrc::RepositoryNotAuthorized;
    }
  return &it->second;
}

outcome::std_result<boost::json::object>
WebhookValidator::parse_payload(const boost::json::object &deployment) const
{
  const auto *val = deployment.if_contains("payload");
  if (val == nullptr)
    {
      logger->warn("deployment has no payload");
      return WebhookErrc::InvalidPayload;
    }

  boost::json::value payload = *val;
  if (payload.is_string())
    {
      boost::json::error_code ec;
      payload = boost::json::parse(payload.as_string(), ec);
      if (ec)
        {
          logger->warn("malformed deployment payload ({})", ec.message());
          return WebhookErrc::InvalidPayload;
        }
    }
  if (!payload.is_object())
    {
      logger->warn("deployment payload is not an object");
      return WebhookErrc::InvalidPayload;
    }
  const auto &obj = payload.as_object();

  const auto *artifact = find_object(obj, "artifact");
  if (artifact == nullptr)
    {
      logger->warn("deployment payload has no artifact");
      return WebhookErrc::InvalidPayload;
    }
  for (const auto *key: {"name", "url", "checksum"})
    {
      if (!find_string(*artifact, key))
        {
          logger->warn("artifact lacks '{}'", key);
          return WebhookErrc::InvalidPayload;
        }
    }
  if (find_string(*artifact, "checksum")->size() != FieldValidators::checksum_length)
    {
      logger->warn("artifact checksum has invalid length");
      return WebhookErrc::InvalidPayload;
    }

  if (const auto *pusher = obj.if_contains("pusher"); pusher != nullptr && !pusher->is_object() && !pusher->is_null())
    {
      logger->warn("deployment pusher is not an object");
      return WebhookErrc::InvalidPayload;
    }
  if (const auto *authors = obj.if_contains("authors"); authors != nullptr && !authors->is_array() && !authors->is_null())
    {
      logger->warn("deployment authors is not a list");
      return WebhookErrc::InvalidPayload;
    }

  return obj;
}

outcome::std_result<void>
WebhookValidator::check_artifact(DeploymentRequest &request, const boost::json::object &payload) const
{
  const auto &artifact = payload.at("artifact").as_object();
  request.artifact.name = *find_string(artifact, "name");
  request.artifact.url = *find_string(artifact, "url");
  request.artifact.checksum = *find_string(artifact, "checksum");

  if (!FieldValidators::parse_artifact_url(request.artifact.url, config->api_url, request.repository))
    {
      logger->warn("artifact URL '{}' is not an asset of {}", request.artifact.url, request.repository);
      return WebhookErrc::InvalidArtifactUrl;
    }

  if (!FieldValidators::is_checksum(request.artifact.checksum))
    {
      logger->warn("invalid artifact checksum format");
      return WebhookErrc::InvalidChecksum;
    }
  return outcome::success();
}

void
WebhookValidator::collect_people(DeploymentRequest &request, const boost::json::object &payload) const
{
  if (const auto *pusher = find_object(payload, "pusher"); pusher != nullptr)
    {
      request.pusher = Person{find_string(*pusher, "name").value_or(""), find_string(*pusher, "email").value_or(""), ""};
    }

  if (const auto *authors = payload.if_contains("authors"); authors != nullptr && authors->is_array())
    {
      for (const auto &author: authors->as_array())
        {
          if (!author.is_object())
            {
              continue;
            }
          const auto &obj = author.as_object();
          request.authors.push_back(Person{find_string(obj, "name").value_or(""),
                                           find_string(obj, "email").value_or(""),
                                           find_string(obj, "username").value_or("")});
        }
    }
}

std::vector<std::string>
WebhookValidator::merge_recipients(const RepositoryIdentity &repository,
                                   const EnvironmentConfig &environment,
                                   const std::optional<Person> &pusher) const
{
  std::vector<std::string> recipients;
  auto add = [&recipients](const std::string &email) {
    if (!email.empty() && std::find(recipients.begin(), recipients.end(), email) == recipients.end())
      {
        recipients.push_back(email);
      }
  };

  std::for_each(config->log_recipients.begin(), config->log_recipients.end(), add);
  std::for_each(repository.log_recipients.begin(), repository.log_recipients.end(), add);
  std::for_each(environment.log_recipients.begin(), environment.log_recipients.end(), add);
  if (pusher)
    {
      add(pusher->email);
    }
  return recipients;
}
