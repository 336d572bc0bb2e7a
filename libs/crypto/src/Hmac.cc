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

#include "crypto/Hmac.hh"

#include <array>

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/params.h>
#include <boost/outcome/try.hpp>

using namespace sitedeploy::crypto;

Hmac::Hmac(std::string_view key)
{
  mac = EVP_MAC_fetch(nullptr, "HMAC", nullptr);
  if (mac == nullptr)
    {
      logger->error("failed to fetch HMAC implementation");
      return;
    }

  ctx = EVP_MAC_CTX_new(mac);
  if (ctx == nullptr)
    {
      logger->error("failed to create HMAC context");
      return;
    }

  char digest_name[] = "SHA256";
  std::array<OSSL_PARAM, 2> params{OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest_name, 0),
                                   OSSL_PARAM_construct_end()};

  if (EVP_MAC_init(ctx, reinterpret_cast<const unsigned char *>(key.data()), key.size(), params.data()) != 1)
    {
      logger->error("failed to initialize HMAC");
      return;
    }
  initialized = true;
}

Hmac::~Hmac()
{
  if (ctx != nullptr)
    {
      EVP_MAC_CTX_free(ctx);
    }
  if (mac != nullptr)
    {
      EVP_MAC_free(mac);
    }
}

outcome::std_result<void>
Hmac::update(std::string_view data)
{
  if (!initialized)
    {
      return CryptoErrc::InternalFailure;
    }
  if (finalized)
    {
      return CryptoErrc::Finalized;
    }

  if (EVP_MAC_update(ctx, reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 1)
    {
      logger->error("failed to update HMAC");
      return CryptoErrc::InternalFailure;
    }
  return outcome::success();
}

outcome::std_result<std::string>
Hmac::digest()
{
  if (!initialized)
    {
      return CryptoErrc::InternalFailure;
    }
  if (finalized)
    {
      return CryptoErrc::Finalized;
    }

  std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
  size_t out_len = 0;
  if (EVP_MAC_final(ctx, out.data(), &out_len, out.size()) != 1)
    {
      logger->error("failed to finalize HMAC");
      return CryptoErrc::InternalFailure;
    }
  finalized = true;

  return std::string(reinterpret_cast<const char *>(out.data()), out_len);
}

outcome::std_result<std::string>
Hmac::hex_digest()
{
  auto rc = digest();
  if (!rc)
    {
      return rc.as_failure();
    }
  return to_hex(rc.value());
}

outcome::std_result<std::string>
Hmac::sha256_hex(std::string_view key, std::string_view data)
{
  Hmac hmac(key);
  BOOST_OUTCOME_TRYV(hmac.update(data));
  return hmac.hex_digest();
}

std::string
sitedeploy::crypto::to_hex(std::string_view bytes)
{
  static constexpr std::string_view digits = "0123456789abcdef";

  std::string ret;
  ret.reserve(bytes.size() * 2);
  for (auto c: bytes)
    {
      auto b = static_cast<unsigned char>(c);
      ret.push_back(digits[b >> 4]);
      ret.push_back(digits[b & 0x0f]);
    }
  return ret;
}

bool
sitedeploy::crypto::constant_time_equals(std::string_view a, std::string_view b)
{
  if (a.size() != b.size())
    {
      return false;
    }
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}
