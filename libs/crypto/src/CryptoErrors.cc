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

#include "crypto/CryptoErrors.hh"

using namespace sitedeploy::crypto;

namespace
{
  struct CryptoErrorCategory : std::error_category
  {
    const char *name() const noexcept override
    {
      return "crypto";
    }
    std::string message(int ev) const override;
  };

  std::string CryptoErrorCategory::message(int ev) const
  {
    switch (static_cast<CryptoErrc>(ev))
      {
      case CryptoErrc::Success:
        return "success";
      case CryptoErrc::InvalidKey:
        return "invalid key";
      case CryptoErrc::UnsupportedKeyType:
        return "unsupported key type";
      case CryptoErrc::Finalized:
        return "digest already finalized";
      case CryptoErrc::InternalFailure:
        return "internal failure";
      }
    return "(unknown)";
  }

  const CryptoErrorCategory globalCryptoErrorCategory{};
} // namespace

std::error_code
sitedeploy::crypto::make_error_code(CryptoErrc ec)
{
  return std::error_code{static_cast<int>(ec), globalCryptoErrorCategory};
}
