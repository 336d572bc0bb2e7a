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

#ifndef WEBHOOK_VALIDATOR_HH
#define WEBHOOK_VALIDATOR_HH

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <boost/json.hpp>
#include <boost/outcome/std_result.hpp>

#include "sitedeploy/Configuration.hh"
#include "sitedeploy/DeploymentRequest.hh"
#include "utils/Logging.hh"

#include "SignatureVerifier.hh"

namespace outcome = boost::outcome_v2;

struct WebhookRequest
{
  std::string method;
  std::string content_type;
  std::string signature;
  std::string event;
  std::string body;
};

using WebhookResult = std::variant<sitedeploy::DeploymentRequest, sitedeploy::IgnoredEvent>;

class WebhookValidator
{
public:
  explicit WebhookValidator(std::shared_ptr<const sitedeploy::Configuration> config);

  outcome::std_result<WebhookResult> validate(const WebhookRequest &request) const;

  static constexpr std::string_view deployment_status_event = "deployment_status";

private:
  static std::map<std::string, std::string> collect_secrets(const sitedeploy::Configuration &config);

  outcome::std_result<void> check_transport(const WebhookRequest &request) const;
  outcome::std_result<const sitedeploy::RepositoryIdentity *> check_repository(const boost::json::object &event,
                                                                                const std::vector<std::string> &identities) const;
  outcome::std_result<boost::json::object> parse_payload(const boost::json::object &deployment) const;
  outcome::std_result<void> check_artifact(sitedeploy::DeploymentRequest &request, const boost::json::object &payload) const;
  void collect_people(sitedeploy::DeploymentRequest &request, const boost::json::object &payload) const;
  std::vector<std::string> merge_recipients(const sitedeploy::RepositoryIdentity &repository,
                                            const sitedeploy::EnvironmentConfig &environment,
                                            const std::optional<sitedeploy::Person> &pusher) const;

private:
  std::shared_ptr<const sitedeploy::Configuration> config;
  SignatureVerifier verifier;
  std::shared_ptr<spdlog::logger> logger{sitedeploy::utils::Logging::create("sitedeploy:webhook")};
};

#endif // WEBHOOK_VALIDATOR_HH
