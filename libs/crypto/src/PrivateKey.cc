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

#include "PrivateKey.hh"

#include <openssl/evp.h>

PrivateKey::PrivateKey(std::string private_key)
  : private_key(std::move(private_key))
{
  load();
}

PrivateKey::~PrivateKey()
{
  if (pkey != nullptr)
    {
      EVP_PKEY_free(pkey);
    }
  OPENSSL_cleanse(private_key.data(), private_key.size());
}

void
PrivateKey::load_pem()
{
  BIO *bio = BIO_new_mem_buf(reinterpret_cast<const unsigned char *>(private_key.data()), static_cast<int>(private_key.size()));
  if (bio != nullptr)
    {
      PEM_read_bio_PrivateKey(bio, &pkey, nullptr, nullptr);
      BIO_free_all(bio);
    }
}

void
PrivateKey::load_der()
{
  BIO *bio = BIO_new_mem_buf(reinterpret_cast<const unsigned char *>(private_key.data()), static_cast<int>(private_key.size()));
  if (bio != nullptr)
    {
      d2i_PrivateKey_bio(bio, &pkey);
      BIO_free_all(bio);
    }
}

void
PrivateKey::load()
{
  load_pem();
  if (pkey == nullptr)
    {
      load_der();
    }
  if (pkey == nullptr)
    {
      logger->error("failed to load private key");
    }
}

EVP_PKEY *
PrivateKey::get() const
{
  return pkey;
}
