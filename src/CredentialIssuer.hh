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

#ifndef CREDENTIAL_ISSUER_HH
#define CREDENTIAL_ISSUER_HH

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/outcome/std_result.hpp>

#include "crypto/JwtSigner.hh"
#include "http/HttpClient.hh"
#include "utils/Logging.hh"
#include "utils/TimeSource.hh"

namespace outcome = boost::outcome_v2;

// Exchanges the application private key for a repository scoped installation access token.
class CredentialIssuer
{
public:
  CredentialIssuer(std::shared_ptr<sitedeploy::http::IHttpClient> http,
                   std::string api_url,
                   std::string client_id,
                   std::shared_ptr<sitedeploy::utils::TimeSource> time_source = std::make_shared<sitedeploy::utils::RealTimeSource>());

  outcome::std_result<void> set_private_key(const std::string &private_key);

  outcome::std_result<std::string> create_jwt() const;

  // `repository` is "owner/name".
  boost::asio::awaitable<outcome::std_result<std::string>> issue(const std::string &repository);

  static constexpr std::chrono::seconds clock_skew{5};
  static constexpr std::chrono::seconds validity{300};

private:
  boost::asio::awaitable<outcome::std_result<std::int64_t>> lookup_installation(const std::string &repository, const std::string &jwt);
  boost::asio::awaitable<outcome::std_result<std::string>> create_access_token(std::int64_t installation_id,
                                                                               const std::string &repository,
                                                                               const std::string &jwt);

private:
  std::shared_ptr<sitedeploy::http::IHttpClient> http;
  std::string api_url;
  std::string client_id;
  std::shared_ptr<sitedeploy::utils::TimeSource> time_source;
  sitedeploy::crypto::JwtSigner signer;
  std::shared_ptr<spdlog::logger> logger{sitedeploy::utils::Logging::create("sitedeploy:credentials")};
};

#endif // CREDENTIAL_ISSUER_HH
