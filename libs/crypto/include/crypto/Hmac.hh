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

#ifndef CRYPTO_HMAC_HH
#define CRYPTO_HMAC_HH

#include <string>
#include <string_view>
#include <memory>

#include <openssl/evp.h>
#include <boost/outcome/std_result.hpp>

#include "utils/Logging.hh"
#include "crypto/CryptoErrors.hh"

namespace outcome = boost::outcome_v2;

namespace sitedeploy::crypto
{
  // Incremental HMAC-SHA256.
  class Hmac
  {
  public:
    explicit Hmac(std::string_view key);
    ~Hmac();

    Hmac(const Hmac &) = delete;
    Hmac &operator=(const Hmac &) = delete;
    Hmac(Hmac &&) = delete;
    Hmac &operator=(Hmac &&) = delete;

    outcome::std_result<void> update(std::string_view data);

    // Finalizes the MAC. Further updates fail with CryptoErrc::Finalized.
    outcome::std_result<std::string> digest();
    outcome::std_result<std::string> hex_digest();

    static outcome::std_result<std::string> sha256_hex(std::string_view key, std::string_view data);

  private:
    EVP_MAC *mac{nullptr};
    EVP_MAC_CTX *ctx{nullptr};
    bool initialized{false};
    bool finalized{false};
    std::shared_ptr<spdlog::logger> logger{sitedeploy::utils::Logging::create("sitedeploy:crypto")};
  };

  std::string to_hex(std::string_view bytes);

  // Compares in time independent of the position of the first difference.
  bool constant_time_equals(std::string_view a, std::string_view b);
} // namespace sitedeploy::crypto

#endif // CRYPTO_HMAC_HH
