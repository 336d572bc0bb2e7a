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

#ifndef CRYPTO_PRIVATE_KEY_HH
#define CRYPTO_PRIVATE_KEY_HH

#include <string>

#include <openssl/pem.h>

#include "utils/Logging.hh"

class PrivateKey
{
public:
  explicit PrivateKey(std::string private_key);
  ~PrivateKey();

  PrivateKey(const PrivateKey &) = delete;
  PrivateKey &operator=(const PrivateKey &) = delete;
  PrivateKey(PrivateKey &&) = delete;
  PrivateKey &operator=(PrivateKey &&) = delete;

  EVP_PKEY *get() const;

private:
  void load();
  void load_pem();
  void load_der();

private:
  std::string private_key;
  EVP_PKEY *pkey{nullptr};
  std::shared_ptr<spdlog::logger> logger{sitedeploy::utils::Logging::create("sitedeploy:crypto")};
};

#endif // CRYPTO_PRIVATE_KEY_HH
