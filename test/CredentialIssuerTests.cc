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
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <openssl/pem.h>

#include <boost/algorithm/string.hpp>
#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include "http/HttpClientErrors.hh"
#include "sitedeploy/SiteDeployErrors.hh"
#include "utils/Base64.hh"

#include "CredentialIssuer.hh"
#include "FakeHost.hh"
#include "HttpClientMock.hh"
#include "TestSupport.hh"

using namespace sitedeploy;
using ::testing::_;

namespace
{
  const std::string api_url = "https://api.example.org";
  constexpr std::int64_t now_seconds = 1700000000;
} // namespace

class CredentialIssuerTest : public ::testing::Test
{
public:
  CredentialIssuerTest()
  {
    pkey = EVP_RSA_gen(2048);
    BIO *bio = BIO_new(BIO_s_mem());
    PEM_write_bio_PrivateKey(bio, pkey, nullptr, nullptr, 0, nullptr, nullptr);
    char *data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    pem = std::string(data, static_cast<size_t>(len));
    BIO_free(bio);

    time_source = std::make_shared<FixedTimeSource>(std::chrono::system_clock::time_point(std::chrono::seconds(now_seconds)));
    issuer = std::make_unique<CredentialIssuer>(http, api_url, "Iv1.client", time_source);
  }

  ~CredentialIssuerTest() override
  {
    EVP_PKEY_free(pkey);
  }

  CredentialIssuerTest(const CredentialIssuerTest &) = delete;
  CredentialIssuerTest &operator=(const CredentialIssuerTest &) = delete;
  CredentialIssuerTest(CredentialIssuerTest &&) = delete;
  CredentialIssuerTest &operator=(CredentialIssuerTest &&) = delete;

protected:
  bool verify_rs256(const std::string &data, const std::string &signature)
  {
    EVP_MD_CTX *ctx = EVP_MD_CTX_new();
    auto rc = EVP_DigestVerifyInit(ctx, nullptr, EVP_sha256(), nullptr, pkey);
    if (rc == 1)
      {
        rc = EVP_DigestVerify(ctx,
                              reinterpret_cast<const unsigned char *>(signature.data()),
                              signature.size(),
                              reinterpret_cast<const unsigned char *>(data.data()),
                              data.size());
      }
    EVP_MD_CTX_free(ctx);
    return rc == 1;
  }

  outcome::std_result<std::string> issue(const std::string &repository)
  {
    outcome::std_result<std::string> result = DeployErrc::InternalError;

    boost::asio::io_context ioc;
    boost::asio::co_spawn(
      ioc,
      [&]() -> boost::asio::awaitable<void> {
        try
          {
            result = co_await issuer->issue(repository);
          }
        catch (std::exception &e)
          {
            spdlog::info("Exception {}", e.what());
            EXPECT_TRUE(false);
          }
      },
      boost::asio::detached);
    ioc.run();
    return result;
  }

  void add_installation()
  {
    host.add_json(boost::beast::http::verb::get, api_url + "/repos/owner/site/installation", 200, boost::json::object{{"id", 77}});
  }

protected:
  EVP_PKEY *pkey{nullptr};
  std::string pem;
  std::shared_ptr<FixedTimeSource> time_source;
  std::shared_ptr<HttpClientMock> http{std::make_shared<HttpClientMock>()};
  FakeHost host;
  std::unique_ptr<CredentialIssuer> issuer;
};

TEST_F(CredentialIssuerTest, jwt_claims)
{
  ASSERT_FALSE(issuer->set_private_key(pem).has_error());

  auto rc = issuer->create_jwt();
  ASSERT_FALSE(rc.has_error());

  std::vector<std::string> parts;
  boost::split(parts, rc.value(), boost::is_any_of("."));
  ASSERT_EQ(parts.size(), 3);

  auto header = boost::json::parse(sitedeploy::utils::Base64::decode_url(parts[0])).as_object();
  EXPECT_EQ(header.at("alg").as_string(), "RS256");
  EXPECT_EQ(header.at("typ").as_string(), "JWT");

  auto claims = boost::json::parse(sitedeploy::utils::Base64::decode_url(parts[1])).as_object();
  EXPECT_EQ(claims.at("iat").as_int64(), now_seconds - 5);
  EXPECT_EQ(claims.at("exp").as_int64(), now_seconds + 300);
  EXPECT_EQ(claims.at("iss").as_string(), "Iv1.client");

  EXPECT_TRUE(verify_rs256(parts[0] + "." + parts[1], sitedeploy::utils::Base64::decode_url(parts[2])));
}

TEST_F(CredentialIssuerTest, jwt_follows_clock)
{
  ASSERT_FALSE(issuer->set_private_key(pem).has_error());
  time_source->advance(std::chrono::seconds(60));

  auto rc = issuer->create_jwt();
  ASSERT_FALSE(rc.has_error());

  std::vector<std::string> parts;
  boost::split(parts, rc.value(), boost::is_any_of("."));
  ASSERT_EQ(parts.size(), 3);
  auto claims = boost::json::parse(sitedeploy::utils::Base64::decode_url(parts[1])).as_object();
  EXPECT_EQ(claims.at("iat").as_int64(), now_seconds + 55);
  EXPECT_EQ(claims.at("exp").as_int64(), now_seconds + 360);
}

TEST_F(CredentialIssuerTest, invalid_private_key)
{
  EXPECT_TRUE(issuer->set_private_key("not a key").has_error());
}

TEST_F(CredentialIssuerTest, issue_token)
{
  ASSERT_FALSE(issuer->set_private_key(pem).has_error());
  host.install(*http);
  add_installation();
  host.add_json(boost::beast::http::verb::post,
                api_url + "/app/installations/77/access_tokens",
                201,
                boost::json::object{{"token", "ghs_token"}, {"expires_at", "2023-11-14T23:13:20Z"}});

  auto rc = issue("owner/site");
  ASSERT_FALSE(rc.has_error());
  EXPECT_EQ(rc.value(), "ghs_token");

  auto lookups = host.get_requests(boost::beast::http::verb::get, api_url + "/repos/owner/site/installation");
  ASSERT_EQ(lookups.size(), 1);
  EXPECT_TRUE(boost::algorithm::starts_with(lookups[0].headers["Authorization"], "Bearer ey"));
  EXPECT_EQ(lookups[0].headers["X-GitHub-Api-Version"], "2022-11-28");

  auto exchanges = host.get_requests(boost::beast::http::verb::post, api_url + "/app/installations/77/access_tokens");
  ASSERT_EQ(exchanges.size(), 1);
  EXPECT_EQ(exchanges[0].headers["Authorization"], lookups[0].headers["Authorization"]);
  auto body = boost::json::parse(exchanges[0].body);
  EXPECT_EQ(body, boost::json::parse(R"({"repositories":["site"]})"));
}

TEST_F(CredentialIssuerTest, issue_without_key)
{
  EXPECT_CALL(*http, execute(_)).Times(0);

  auto rc = issue("owner/site");
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), DeployErrc::CredentialsUnavailable);
}

TEST_F(CredentialIssuerTest, issue_not_installed)
{
  ASSERT_FALSE(issuer->set_private_key(pem).has_error());
  host.install(*http);

  auto rc = issue("owner/site");
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), DeployErrc::CredentialsUnavailable);
  EXPECT_TRUE(host.get_requests(boost::beast::http::verb::post, api_url + "/app/installations/77/access_tokens").empty());
}

TEST_F(CredentialIssuerTest, issue_installation_without_id)
{
  ASSERT_FALSE(issuer->set_private_key(pem).has_error());
  host.install(*http);
  host.add_json(boost::beast::http::verb::get, api_url + "/repos/owner/site/installation", 200, boost::json::object{{"id", "77"}});

  auto rc = issue("owner/site");
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), DeployErrc::CredentialsUnavailable);
}

TEST_F(CredentialIssuerTest, issue_token_refused)
{
  ASSERT_FALSE(issuer->set_private_key(pem).has_error());
  host.install(*http);
  add_installation();
  host.add_json(boost::beast::http::verb::post,
                api_url + "/app/installations/77/access_tokens",
                403,
                boost::json::object{{"message", "Resource not accessible by integration"}});

  auto rc = issue("owner/site");
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), DeployErrc::CredentialsUnavailable);
}

TEST_F(CredentialIssuerTest, issue_token_missing)
{
  ASSERT_FALSE(issuer->set_private_key(pem).has_error());
  host.install(*http);
  add_installation();
  host.add_json(boost::beast::http::verb::post, api_url + "/app/installations/77/access_tokens", 201, boost::json::object{{"token", ""}});

  auto rc = issue("owner/site");
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), DeployErrc::CredentialsUnavailable);

  host.add(boost::beast::http::verb::post, api_url + "/app/installations/77/access_tokens", 201, "not json");
  rc = issue("owner/site");
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), DeployErrc::CredentialsUnavailable);
}

TEST_F(CredentialIssuerTest, issue_transport_failure)
{
  ASSERT_FALSE(issuer->set_private_key(pem).has_error());
  EXPECT_CALL(*http, execute(_))
    .WillOnce(::testing::InvokeWithoutArgs([]() -> boost::asio::awaitable<outcome::std_result<sitedeploy::http::Response>> {
      co_return sitedeploy::http::HttpClientErrc::CommunicationError;
    }));

  auto rc = issue("owner/site");
  ASSERT_TRUE(rc.has_error());
  EXPECT_EQ(rc.error(), DeployErrc::CredentialsUnavailable);
}
