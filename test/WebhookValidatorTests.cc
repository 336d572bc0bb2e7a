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

#include <memory>
#include <string>

#include <boost/json.hpp>

#include "sitedeploy/Configuration.hh"
#include "sitedeploy/SiteDeployErrors.hh"

#include "SignatureVerifier.hh"
#include "WebhookValidator.hh"

using namespace sitedeploy;

namespace
{
  const std::string sha = "0123456789abcdef0123456789abcdef01234567";
  const std::string checksum = "sha256=" + std::string(64, 'f');
  const std::string api_url = "https://api.example.org";
} // namespace

TEST(SignatureVerifier, sign_format)
{
  auto rc = SignatureVerifier::sign("It's a Secret to Everybody", "Hello, World!");
  ASSERT_FALSE(rc.has_error());
  EXPECT_EQ(rc.value(), "sha256=757107ea0eb2509fc211221cce984b8a37570b6d7586c22c46f4379c8b043e17");
}

TEST(SignatureVerifier, verify_identities)
{
  SignatureVerifier verifier({{"owner/a", "secret-a"}, {"owner/b", "secret-b"}, {"owner/c", "secret-a"}});
  const std::string body = R"({"hello":"world"})";

  auto rc = verifier.verify(body, SignatureVerifier::sign("secret-b", body).value());
  ASSERT_FALSE(rc.has_error());
  EXPECT_THAT(rc.value(), ::testing::ElementsAre("owner/b"));

  rc = verifier.verify(body, SignatureVerifier::sign("secret-a", body).value());
  ASSERT_FALSE(rc.has_error());
  EXPECT_THAT(rc.value(), ::testing::UnorderedElementsAre("owner/a", "owner/c"));
}

TEST(SignatureVerifier, verify_rejects)
{
  SignatureVerifier verifier({{"owner/a", "secret-a"}});
  const std::string body = R"({"hello":"world"})";
  auto signature = SignatureVerifier::sign("secret-a", body).value();

  auto rc = verifier.verify(body, "");
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), WebhookErrc::InvalidSignature);

  rc = verifier.verify(body, SignatureVerifier::sign("secret-x", body).value());
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), WebhookErrc::InvalidSignature);

  rc = verifier.verify(body + " ", signature);
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), WebhookErrc::InvalidSignature);

  rc = verifier.verify(body, signature.substr(7));
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), WebhookErrc::InvalidSignature);

  auto flipped = signature;
  flipped.back() = flipped.back() == '0' ? '1' : '0';
  rc = verifier.verify(body, flipped);
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), WebhookErrc::InvalidSignature);
}

class WebhookValidatorTest : public ::testing::Test
{
public:
  WebhookValidatorTest()
  {
    auto rc = Configuration::load_from_string(R"({
      "api_url": "https://api.example.org",
      "app": { "client_id": "Iv1.client", "private_key": "PEM" },
      "deployment_key": "deploy-key",
      "log_recipients": ["ops@example.org"],
      "repositories": {
        "owner/site": {
          "secret": "site-secret",
          "log_recipients": ["dev@example.org", "ops@example.org"],
          "environments": {
            "production": { "deploy_url": "https://example.org", "webroot": "/srv/www/site", "log_recipients": ["web@example.org"] }
          }
        },
        "owner/other": {
          "secret": "other-secret",
          "environments": {
            "production": { "deploy_url": "https://other.example.org", "webroot": "/srv/www/other" }
          }
        }
      }
    })");
    EXPECT_FALSE(rc.has_error());
    config = std::make_shared<const Configuration>(rc.value());
    validator = std::make_unique<WebhookValidator>(config);
  }

protected:
  boost::json::object make_payload()
  {
    return boost::json::object{
      {"artifact", {{"name", "site.tar.zst"}, {"url", api_url + "/repos/owner/site/releases/assets/1001"}, {"checksum", checksum}}},
      {"pusher", {{"name", "Pusher"}, {"email", "pusher@example.org"}}},
      {"authors", boost::json::array{boost::json::object{{"name", "Author"}, {"email", "author@example.org"}, {"username", "author"}}}}};
  }

  boost::json::object make_event()
  {
    return boost::json::object{
      {"repository", {{"full_name", "owner/site"}}},
      {"deployment",
       {{"id", 42}, {"sha", sha}, {"task", "deploy"}, {"environment", "production"}, {"payload", make_payload()}}},
      {"deployment_status", {{"state", "pending"}, {"environment", "production"}}}};
  }

  WebhookRequest make_request(const boost::json::object &event, const std::string &secret = "site-secret")
  {
    WebhookRequest request;
    request.method = "POST";
    request.content_type = "application/json";
    request.event = "deployment_status";
    request.body = boost::json::serialize(event);
    request.signature = SignatureVerifier::sign(secret, request.body).value();
    return request;
  }

  void expect_error(const WebhookRequest &request, WebhookErrc expected)
  {
    auto rc = validator->validate(request);
    ASSERT_TRUE(rc.has_error());
    EXPECT_EQ(rc.error(), expected);
  }

  void expect_error(const boost::json::object &event, WebhookErrc expected)
  {
    expect_error(make_request(event), expected);
  }

protected:
  std::shared_ptr<const Configuration> config;
  std::unique_ptr<WebhookValidator> validator;
};

TEST_F(WebhookValidatorTest, valid_deployment)
{
  auto rc = validator->validate(make_request(make_event()));
  ASSERT_FALSE(rc.has_error());
  ASSERT_TRUE(std::holds_alternative<DeploymentRequest>(rc.value()));

  const auto &request = std::get<DeploymentRequest>(rc.value());
  EXPECT_EQ(request.repository, "owner/site");
  EXPECT_EQ(request.environment, "production");
  EXPECT_EQ(request.deployment_id, 42);
  EXPECT_EQ(request.commit_sha, sha);
  EXPECT_EQ(request.deploy_url, "https://example.org");
  EXPECT_EQ(request.webroot, std::filesystem::path("/srv/www/site"));
  EXPECT_EQ(request.artifact.name, "site.tar.zst");
  EXPECT_EQ(request.artifact.url, api_url + "/repos/owner/site/releases/assets/1001");
  EXPECT_EQ(request.artifact.checksum, checksum);
  ASSERT_TRUE(request.pusher.has_value());
  EXPECT_EQ(request.pusher->email, "pusher@example.org");
  ASSERT_EQ(request.authors.size(), 1);
  EXPECT_EQ(request.authors[0].username, "author");
  EXPECT_THAT(request.log_recipients,
              ::testing::ElementsAre("ops@example.org", "dev@example.org", "web@example.org", "pusher@example.org"));
}

TEST_F(WebhookValidatorTest, payload_as_string)
{
  auto event = make_event();
  event["deployment"].as_object()["payload"] = boost::json::serialize(make_payload());

  auto rc = validator->validate(make_request(event));
  ASSERT_FALSE(rc.has_error());
  ASSERT_TRUE(std::holds_alternative<DeploymentRequest>(rc.value()));
}

TEST_F(WebhookValidatorTest, payload_without_people)
{
  auto payload = make_payload();
  payload.erase("pusher");
  payload["authors"] = nullptr;
  auto event = make_event();
  event["deployment"].as_object()["payload"] = payload;

  auto rc = validator->validate(make_request(event));
  ASSERT_FALSE(rc.has_error());
  const auto &request = std::get<DeploymentRequest>(rc.value());
  EXPECT_FALSE(request.pusher.has_value());
  EXPECT_TRUE(request.authors.empty());
  EXPECT_THAT(request.log_recipients, ::testing::ElementsAre("ops@example.org", "dev@example.org", "web@example.org"));
}

TEST_F(WebhookValidatorTest, content_type_with_parameters)
{
  auto request = make_request(make_event());
  request.content_type = "Application/JSON; charset=utf-8";
  auto rc = validator->validate(request);
  ASSERT_FALSE(rc.has_error());
}

TEST_F(WebhookValidatorTest, other_event_is_ignored)
{
  auto request = make_request(make_event());
  request.event = "push";
  auto rc = validator->validate(request);
  ASSERT_FALSE(rc.has_error());
  ASSERT_TRUE(std::holds_alternative<IgnoredEvent>(rc.value()));
  EXPECT_EQ(std::get<IgnoredEvent>(rc.value()).reason, "event 'push' ignored");
}

TEST_F(WebhookValidatorTest, non_pending_state_is_ignored)
{
  for (const auto *state: {"success", "failure", "in_progress", "queued"})
    {
      auto event = make_event();
      event["deployment_status"].as_object()["state"] = state;
      auto rc = validator->validate(make_request(event));
      ASSERT_FALSE(rc.has_error());
      ASSERT_TRUE(std::holds_alternative<IgnoredEvent>(rc.value()));
      EXPECT_EQ(std::get<IgnoredEvent>(rc.value()).reason, std::string("deployment status '") + state + "' ignored");
    }
}

TEST_F(WebhookValidatorTest, wrong_method)
{
  auto request = make_request(make_event());
  request.method = "GET";
  expect_error(request, WebhookErrc::MethodNotAllowed);
}

TEST_F(WebhookValidatorTest, wrong_content_type)
{
  auto request = make_request(make_event());
  request.content_type = "application/x-www-form-urlencoded";
  expect_error(request, WebhookErrc::UnsupportedMediaType);

  request.content_type = "";
  expect_error(request, WebhookErrc::UnsupportedMediaType);
}

TEST_F(WebhookValidatorTest, invalid_signature)
{
  auto request = make_request(make_event());
  request.signature.clear();
  expect_error(request, WebhookErrc::InvalidSignature);

  expect_error(make_request(make_event(), "unknown-secret"), WebhookErrc::InvalidSignature);

  request = make_request(make_event());
  request.body += "\n";
  expect_error(request, WebhookErrc::InvalidSignature);
}

TEST_F(WebhookValidatorTest, signature_of_other_repository)
{
  expect_error(make_request(make_event(), "other-secret"), WebhookErrc::RepositoryNotAuthorized);
}

TEST_F(WebhookValidatorTest, malformed_json)
{
  WebhookRequest request;
  request.method = "POST";
  request.content_type = "application/json";
  request.event = "deployment_status";
  request.body = "{\"repository\":";
  request.signature = SignatureVerifier::sign("site-secret", request.body).value();
  expect_error(request, WebhookErrc::MalformedJson);

  request.body = "[1, 2]";
  request.signature = SignatureVerifier::sign("site-secret", request.body).value();
  expect_error(request, WebhookErrc::MalformedJson);
}

TEST_F(WebhookValidatorTest, unknown_repository)
{
  auto event = make_event();
  event["repository"].as_object()["full_name"] = "owner/unknown";
  expect_error(event, WebhookErrc::UnknownRepository);

  event.erase("repository");
  expect_error(event, WebhookErrc::UnknownRepository);
}

TEST_F(WebhookValidatorTest, missing_deployment)
{
  auto event = make_event();
  event.erase("deployment");
  expect_error(event, WebhookErrc::InvalidPayload);

  event = make_event();
  event.erase("deployment_status");
  expect_error(event, WebhookErrc::InvalidPayload);
}

TEST_F(WebhookValidatorTest, unknown_environment)
{
  auto event = make_event();
  event["deployment"].as_object()["environment"] = "staging";
  event["deployment_status"].as_object()["environment"] = "staging";
  expect_error(event, WebhookErrc::UnknownEnvironment);

  event["deployment"].as_object()["environment"] = "../production";
  expect_error(event, WebhookErrc::UnknownEnvironment);
}

TEST_F(WebhookValidatorTest, invalid_task)
{
  auto event = make_event();
  event["deployment"].as_object()["task"] = "deploy:migrations";
  expect_error(event, WebhookErrc::InvalidTask);

  event["deployment"].as_object().erase("task");
  expect_error(event, WebhookErrc::InvalidTask);
}

TEST_F(WebhookValidatorTest, invalid_deployment_id)
{
  auto event = make_event();
  event["deployment"].as_object()["id"] = 0;
  expect_error(event, WebhookErrc::InvalidDeploymentId);

  event["deployment"].as_object()["id"] = "42";
  expect_error(event, WebhookErrc::InvalidDeploymentId);

  event["deployment"].as_object()["id"] = -5;
  expect_error(event, WebhookErrc::InvalidDeploymentId);
}

TEST_F(WebhookValidatorTest, invalid_commit_sha)
{
  auto event = make_event();
  event["deployment"].as_object()["sha"] = sha.substr(1);
  expect_error(event, WebhookErrc::InvalidCommitSha);

  event["deployment"].as_object()["sha"] = "z" + sha.substr(1);
  expect_error(event, WebhookErrc::InvalidCommitSha);
}

TEST_F(WebhookValidatorTest, environment_mismatch)
{
  auto event = make_event();
  event["deployment_status"].as_object()["environment"] = "staging";
  expect_error(event, WebhookErrc::EnvironmentMismatch);
}

TEST_F(WebhookValidatorTest, invalid_payload)
{
  auto event = make_event();
  event["deployment"].as_object().erase("payload");
  expect_error(event, WebhookErrc::InvalidPayload);

  event["deployment"].as_object()["payload"] = "{not json";
  expect_error(event, WebhookErrc::InvalidPayload);

  event["deployment"].as_object()["payload"] = boost::json::array{};
  expect_error(event, WebhookErrc::InvalidPayload);

  auto payload = make_payload();
  payload["artifact"].as_object().erase("name");
  event["deployment"].as_object()["payload"] = payload;
  expect_error(event, WebhookErrc::InvalidPayload);

  payload = make_payload();
  payload["artifact"].as_object()["checksum"] = checksum + "0";
  event["deployment"].as_object()["payload"] = payload;
  expect_error(event, WebhookErrc::InvalidPayload);

  payload = make_payload();
  payload["pusher"] = "pusher@example.org";
  event["deployment"].as_object()["payload"] = payload;
  expect_error(event, WebhookErrc::InvalidPayload);

  payload = make_payload();
  payload["authors"] = boost::json::object{};
  event["deployment"].as_object()["payload"] = payload;
  expect_error(event, WebhookErrc::InvalidPayload);
}

TEST_F(WebhookValidatorTest, invalid_artifact_url)
{
  for (const auto &url: {std::string("https://evil.example.org/repos/owner/site/releases/assets/1001"),
                         api_url + "/repos/owner/other/releases/assets/1001",
                         api_url + "/repos/owner/site/releases/assets/abc",
                         api_url + "/repos/owner/site/releases/assets/1001/../1002"})
    {
      auto payload = make_payload();
      payload["artifact"].as_object()["url"] = url;
      auto event = make_event();
      event["deployment"].as_object()["payload"] = payload;
      expect_error(event, WebhookErrc::InvalidArtifactUrl);
    }
}

TEST_F(WebhookValidatorTest, invalid_checksum)
{
  auto payload = make_payload();
  payload["artifact"].as_object()["checksum"] = "sha512=" + std::string(64, 'f');
  auto event = make_event();
  event["deployment"].as_object()["payload"] = payload;
  expect_error(event, WebhookErrc::InvalidChecksum);

  payload["artifact"].as_object()["checksum"] = "sha256=" + std::string(63, 'f') + "g";
  event["deployment"].as_object()["payload"] = payload;
  expect_error(event, WebhookErrc::InvalidChecksum);
}
