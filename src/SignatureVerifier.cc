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

#include "SignatureVerifier.hh"

#include <utility>

#include <boost/outcome/try.hpp>

#include "crypto/Hmac.hh"
#include "sitedeploy/SiteDeployErrors.hh"

SignatureVerifier::SignatureVerifier(std::map<std::string, std::string> secrets)
  : secrets(std::move(secrets))
{
}

outcome::std_result<std::string>
SignatureVerifier::sign(std::string_view secret, std::string_view body)
{
  BOOST_OUTCOME_TRY(auto digest, sitedeploy::crypto::Hmac::sha256_hex(secret, body));
  return "sha256=" + digest;
}

outcome::std_result<std::vector<std::string>>
SignatureVerifier::verify(std::string_view body, std::string_view signature) const
{
  std::vector<std::string> matches;

  if (signature.empty())
    {
      logger->warn("request carries no signature");
      return sitedeploy::WebhookErrc::InvalidSignature;
    }

  for (const auto &[identity, secret]: secrets)
    {
      auto expected = sign(secret, body);
      if (!expected)
        {
          logger->error("failed to compute signature for {} ({})", identity, expected.error().message());
          continue;
        }

      if (sitedeploy::crypto::constant_time_equals(expected.value(), signature))
        {
          matches.push_back(identity);
        }
    }

  if (matches.empty())
    {
      logger->warn("signature does not match any configured repository");
      return sitedeploy::WebhookErrc::InvalidSignature;
    }
  return matches;
}
