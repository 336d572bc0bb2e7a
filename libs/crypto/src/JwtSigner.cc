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

#include "crypto/JwtSigner.hh"

#include <openssl/evp.h>

#include "utils/Base64.hh"
#include "PrivateKey.hh"

using namespace sitedeploy::crypto;

namespace
{
  constexpr auto jwt_header = R"({"alg":"RS256","typ":"JWT"})";
}

JwtSigner::JwtSigner() = default;
JwtSigner::~JwtSigner() = default;

outcome::std_result<void>
JwtSigner::set_key(const std::string &private_key)
{
  auto k = std::make_unique<PrivateKey>(private_key);
  if (k->get() == nullptr)
    {
      return CryptoErrc::InvalidKey;
    }

  if (EVP_PKEY_get_base_id(k->get()) != EVP_PKEY_RSA)
    {
      logger->error("private key is not an RSA key");
      return CryptoErrc::UnsupportedKeyType;
    }

  key = std::move(k);
  return outcome::success();
}

outcome::std_result<std::string>
JwtSigner::sign(const std::string &claims) const
{
  if (!key)
    {
      logger->error("no signing key configured");
      return CryptoErrc::InvalidKey;
    }

  std::string signing_input = sitedeploy::utils::Base64::encode_url(jwt_header) + "."
                              + sitedeploy::utils::Base64::encode_url(claims);

  auto signature = sign_rs256(signing_input);
  if (!signature)
    {
      return signature.as_failure();
    }

  return signing_input + "." + sitedeploy::utils::Base64::encode_url(signature.value());
}

outcome::std_result<std::string>
JwtSigner::sign_rs256(const std::string &data) const
{
  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (ctx == nullptr)
    {
      logger->error("failed to create digest context");
      return CryptoErrc::InternalFailure;
    }

  std::string signature;
  size_t signature_len = 0;

  auto rc = EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, key->get());
  if (rc == 1)
    {
      rc = EVP_DigestSign(ctx,
                          nullptr,
                          &signature_len,
                          reinterpret_cast<const unsigned char *>(data.data()),
                          data.size());
    }
  if (rc == 1)
    {
      signature.resize(signature_len);
      rc = EVP_DigestSign(ctx,
                          reinterpret_cast<unsigned char *>(signature.data()),
                          &signature_len,
                          reinterpret_cast<const unsigned char *>(data.data()),
                          data.size());
    }
  EVP_MD_CTX_free(ctx);

  if (rc != 1)
    {
      logger->error("failed to sign token");
      return CryptoErrc::InternalFailure;
    }

  signature.resize(signature_len);
  return signature;
}
