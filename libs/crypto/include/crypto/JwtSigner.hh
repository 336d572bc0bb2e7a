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

#ifndef CRYPTO_JWT_SIGNER_HH
#define CRYPTO_JWT_SIGNER_HH

#include <string>
#include <memory>

#include <boost/outcome/std_result.hpp>

#include "utils/Logging.hh"
#include "crypto/CryptoErrors.hh"

namespace outcome = boost::outcome_v2;

class PrivateKey;

namespace sitedeploy::crypto
{
  // Produces compact RS256 JSON Web Tokens.
  class JwtSigner
  {
  public:
    JwtSigner();
    ~JwtSigner();

    JwtSigner(const JwtSigner &) = delete;
    JwtSigner &operator=(const JwtSigner &) = delete;
    JwtSigner(JwtSigner &&) = delete;
    JwtSigner &operator=(JwtSigner &&) = delete;

    outcome::std_result<void> set_key(const std::string &private_key);

    // `claims` is the serialized JSON claim set.
    outcome::std_result<std::string> sign(const std::string &claims) const;

  private:
    outcome::std_result<std::string> sign_rs256(const std::string &data) const;

  private:
    std::unique_ptr<PrivateKey> key;
    std::shared_ptr<spdlog::logger> logger{sitedeploy::utils::Logging::create("sitedeploy:jwt")};
  };
} // namespace sitedeploy::crypto

#endif // CRYPTO_JWT_SIGNER_HH
