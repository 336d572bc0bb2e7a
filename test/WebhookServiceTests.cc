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

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <openssl/pem.h>

#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include "http/HttpServer.hh"
#include "sitedeploy/Configuration.hh"
#include "utils/IOContext.hh"
#include "utils/TempDirectory.hh"

#include "DeploymentLock.hh"
#include "FakeHost.hh"
#include "HttpClientMock.hh"
#include "LogCollector.hh"
#include "MailTransport.hh"
#include "SignatureVerifier.hh"
#include "TestSupport.hh"
#include "WebhookService.hh"

using namespace sitedeploy;
using namespace std::chrono_literals;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
namespace beast_http = boost::beast::http;

namespace
{
  const std::string api_url = "https://api.example.org";
  const std::string web_url = "https://example.org";
  const std::string asset_url = api_url + "/repos/owner/site/releases/assets/1001";
  const std::string statuses_url = api_url + "/repos/owner/site/deployments/42/statuses";
  const std::string deployment_key = "deployment-key";
  const std::string sha = "0123456789abcdef0123456789abcdef01234567";

  std::string generate_private_key()
  {
    EVP_PKEY *pkey = EVP_RSA_gen(2048);
    BIO *bio = BIO_new(BIO_s_mem());
    PEM_write_bio_PrivateKey(bio, pkey, nullptr, nullptr, 0, nullptr, nullptr);
    char *data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string pem(data, static_cast<size_t>(len));
    BIO_free(bio);
    EVP_PKEY_free(pkey);
    return pem;
  }

  class RecordingTransport : public MailTransport
  {
  public:
    struct Mail
    {
      std::vector<std::string> recipients;
      std::string subject;
      std::vector<std::string> lines;
    };

    outcome::std_result<void> send(const std::vector<std::string> &recipients,
                                   const std::string &subject,
                                   const std::vector<std::string> &lines) override
    {
      std::scoped_lock lock(mutex);
      mails.push_back(Mail{recipients, subject, lines});
      return outcome::success();
    }

    std::vector<Mail> get_mails() const
    {
      std::scoped_lock lock(mutex);
      return mails;
    }

  private:
    mutable std::mutex mutex;
    std::vector<Mail> mails;
  };
} // namespace

class WebhookServiceTest : public ::testing::Test
{
public:
  WebhookServiceTest()
  {
    host.install(*http);
    host.install(*status_http);
    host.add_json(beast_http::verb::get, api_url + "/repos/owner/site/installation", 200, boost::json::object{{"id", 77}});
    host.add_json(beast_http::verb::post, api_url + "/app/installations/77/access_tokens", 201, boost::json::object{{"token", "ghs_token"}});
    host.add(beast_http::verb::post, statuses_url, 201, "{}");

    Configuration configuration;
    configuration.api_url = api_url;
    configuration.web_url = web_url;
    configuration.app = AppConfig{"Iv1.client", generate_private_key()};
    configuration.deployment_key = deployment_key;
    configuration.log_recipients = {"ops@example.org"};

    RepositoryIdentity repository;
    repository.name = "owner/site";
    repository.secret = "site-secret";
    repository.environments["production"] = EnvironmentConfig{"production", "https://www.example.org", webroot, {}};
    configuration.repositories["owner/site"] = repository;
    config = std::make_shared<const Configuration>(configuration);

    service = std::make_shared<WebhookService>(config, http, status_http, transport, workers);
    EXPECT_FALSE(service->init().has_error());
    service->set_time_source(std::make_shared<FixedTimeSource>(std::chrono::system_clock::time_point(std::chrono::seconds(1704164645))));
  }

  ~WebhookServiceTest() override
  {
    service->shutdown();
    workers.drain();
    workers.wait();
  }

  WebhookServiceTest(const WebhookServiceTest &) = delete;
  WebhookServiceTest &operator=(const WebhookServiceTest &) = delete;
  WebhookServiceTest(WebhookServiceTest &&) = delete;
  WebhookServiceTest &operator=(WebhookServiceTest &&) = delete;

protected:
  boost::json::object make_event(const std::string &content, const std::string &state = "pending")
  {
    boost::json::object payload{{"artifact", {{"name", "site.tar"}, {"url", asset_url}, {"checksum", make_checksum(deployment_key, content)}}}};
    return boost::json::object{
      {"repository", {{"full_name", "owner/site"}}},
      {"deployment", {{"id", 42}, {"sha", sha}, {"task", "deploy"}, {"environment", "production"}, {"payload", payload}}},
      {"deployment_status", {{"state", state}, {"environment", "production"}}}};
  }

  http::ServerRequest make_request(const boost::json::object &event, const std::string &secret = "site-secret")
  {
    http::ServerRequest request{beast_http::verb::post, "/webhook", 11};
    request.set(beast_http::field::content_type, "application/json");
    request.set("X-GitHub-Event", "deployment_status");
    request.body() = boost::json::serialize(event);
    request.set("X-Hub-Signature-256", SignatureVerifier::sign(secret, request.body()).value());
    request.prepare_payload();
    return request;
  }

  http::ServerResponse handle(http::ServerRequest request)
  {
    http::ServerResponse response;

    boost::asio::io_context ioc;
    boost::asio::co_spawn(
      ioc,
      [&]() -> boost::asio::awaitable<void> {
        try
          {
            response = co_await service->handle(std::move(request));
          }
        catch (std::exception &e)
          {
            spdlog::info("Exception {}", e.what());
            EXPECT_TRUE(false);
          }
      },
      boost::asio::detached);
    ioc.run();
    return response;
  }

  void wait_for_workers()
  {
    workers.drain();
    workers.wait();
  }

protected:
  sitedeploy::utils::TempDirectory dir;
  std::filesystem::path webroot{dir.get_path() / "site"};
  std::shared_ptr<HttpClientMock> http{std::make_shared<HttpClientMock>()};
  std::shared_ptr<HttpClientMock> status_http{std::make_shared<HttpClientMock>()};
  std::shared_ptr<RecordingTransport> transport{std::make_shared<RecordingTransport>()};
  FakeHost host;
  std::shared_ptr<const Configuration> config;
  sitedeploy::utils::IOContext workers{2};
  std::shared_ptr<WebhookService> service;
};

TEST_F(WebhookServiceTest, deployment_succeeds_within_grace)
{
  auto content = make_archive({{"index.html", "hello"}});
  host.add_asset(asset_url, content);
  service->set_startup_grace(10s);

  auto response = handle(make_request(make_event(content)));
  EXPECT_EQ(response.result(), beast_http::status::ok);
  EXPECT_EQ(response.body(), "deployment 42 succeeded");

  wait_for_workers();

  EXPECT_EQ(read_file(webroot / "index.html"), "hello");
  EXPECT_EQ(std::filesystem::read_symlink(webroot), std::filesystem::path("20240102030405_" + sha + "_42"));
  EXPECT_THAT(host.get_states(statuses_url), ElementsAre("queued", "in_progress", "success"));
  EXPECT_EQ(service->get_active_count(), 0);

  auto statuses = host.get_requests(beast_http::verb::post, statuses_url);
  ASSERT_FALSE(statuses.empty());
  EXPECT_EQ(statuses[0].headers["Authorization"], "Bearer ghs_token");

  auto mails = transport->get_mails();
  ASSERT_EQ(mails.size(), 1);
  EXPECT_EQ(mails[0].subject, "[sitedeploy] owner/site production deployment 42 succeeded");
  EXPECT_THAT(mails[0].recipients, Contains("ops@example.org"));
  EXPECT_FALSE(mails[0].lines.empty());
}

TEST_F(WebhookServiceTest, deployment_fails_within_grace)
{
  service->set_startup_grace(10s);

  auto response = handle(make_request(make_event("missing")));
  EXPECT_EQ(response.result(), beast_http::status::internal_server_error);
  EXPECT_EQ(response.body(), make_error_code(DeployErrc::DownloadFailed).message());

  wait_for_workers();

  EXPECT_FALSE(std::filesystem::exists(std::filesystem::symlink_status(webroot)));
  EXPECT_THAT(host.get_states(statuses_url), ElementsAre("queued", "in_progress", "failure"));

  auto mails = transport->get_mails();
  ASSERT_EQ(mails.size(), 1);
  EXPECT_EQ(mails[0].subject, "[sitedeploy] owner/site production deployment 42 failed");
}

TEST_F(WebhookServiceTest, long_deployment_is_accepted)
{
  LogCollector collector(nullptr, {}, "holder");
  DeploymentLock holder(webroot, collector, 20ms);

  std::optional<outcome::std_result<LockHandle>> held;
  boost::asio::io_context ioc;
  boost::asio::co_spawn(
    ioc,
    [&]() -> boost::asio::awaitable<void> { held = co_await holder.acquire(1s); },
    boost::asio::detached);
  ioc.run();
  ASSERT_TRUE(held.has_value() && held->has_value());

  auto content = make_archive({{"index.html", "hello"}});
  host.add_asset(asset_url, content);
  service->set_startup_grace(200ms);
  service->set_lock_timeout(60s);

  auto response = handle(make_request(make_event(content)));
  EXPECT_EQ(response.result(), beast_http::status::accepted);
  EXPECT_EQ(response.body(), "deployment 42 accepted");

  auto start = std::chrono::steady_clock::now();
  service->shutdown();
  wait_for_workers();
  EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);

  EXPECT_EQ(service->get_active_count(), 0);
  EXPECT_FALSE(std::filesystem::exists(std::filesystem::symlink_status(webroot)));
  EXPECT_THAT(host.get_states(statuses_url), ElementsAre("queued", "failure"));

  auto mails = transport->get_mails();
  ASSERT_EQ(mails.size(), 1);
  EXPECT_THAT(mails[0].subject, HasSubstr("failed"));
}

TEST_F(WebhookServiceTest, rejects_invalid_signature)
{
  auto response = handle(make_request(make_event("content"), "wrong-secret"));
  EXPECT_EQ(response.result(), beast_http::status::forbidden);
  EXPECT_EQ(response.body(), "invalid signature");
  EXPECT_TRUE(host.get_requests().empty());
}

TEST_F(WebhookServiceTest, rejects_method_and_content_type)
{
  auto request = make_request(make_event("content"));
  request.method(beast_http::verb::get);
  EXPECT_EQ(handle(request).result(), beast_http::status::method_not_allowed);

  request = make_request(make_event("content"));
  request.set(beast_http::field::content_type, "text/plain");
  EXPECT_EQ(handle(request).result(), beast_http::status::unsupported_media_type);
  EXPECT_TRUE(host.get_requests().empty());
}

TEST_F(WebhookServiceTest, ignores_other_states)
{
  auto response = handle(make_request(make_event("content", "success")));
  EXPECT_EQ(response.result(), beast_http::status::ok);
  EXPECT_EQ(response.body(), "deployment status 'success' ignored");
  EXPECT_TRUE(host.get_requests().empty());
}

TEST_F(WebhookServiceTest, credentials_unavailable)
{
  host.add(beast_http::verb::get, api_url + "/repos/owner/site/installation", 404, R"({"message":"Not Found"})");

  auto response = handle(make_request(make_event("content")));
  EXPECT_EQ(response.result(), beast_http::status::internal_server_error);
  EXPECT_TRUE(host.get_requests(beast_http::verb::post, statuses_url).empty());
}

TEST_F(WebhookServiceTest, refuses_after_shutdown)
{
  service->shutdown();

  auto response = handle(make_request(make_event("content")));
  EXPECT_EQ(response.result(), beast_http::status::service_unavailable);
  EXPECT_TRUE(host.get_requests().empty());
}
