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

#ifndef SIGNATURE_VERIFIER_HH
#define SIGNATURE_VERIFIER_HH

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/outcome/std_result.hpp>

#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

// Matches a webhook signature against every configured identity.
class SignatureVerifier
{
public:
  // `secrets` maps identity name to shared secret.
  explicit SignatureVerifier(std::map<std::string, std::string> secrets);

  // Returns the identities whose secret produced `signature` over `body`.
  outcome::std_result<std::vector<std::string>> verify(std::string_view body, std::string_view signature) const;

  // "sha256=" followed by the hex HMAC-SHA256 of `body`.
  static outcome::std_result<std::string> sign(std::string_view secret, std::string_view body);

private:
  std::map<std::string, std::string> secrets;
  std::shared_ptr<spdlog::logger> logger{sitedeploy::utils::Logging::create("sitedeploy:signature")};
};

#endif // SIGNATURE_VERIFIER_HH
