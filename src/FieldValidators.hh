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

#ifndef FIELD_VALIDATORS_HH
#define FIELD_VALIDATORS_HH

#include <cstdint>
#include <optional>
#include <string_view>

class FieldValidators
{
public:
  // Exactly 40 hexadecimal digits.
  static bool is_commit_sha(std::string_view sha);

  // "sha256=" followed by exactly 64 hexadecimal digits.
  static bool is_checksum(std::string_view checksum);

  // Non-empty, [A-Za-z0-9._-] only, and not "." or "..".
  static bool is_name(std::string_view name);

  // "owner/name", both parts valid names.
  static bool is_repository_name(std::string_view name);

  static std::optional<std::int64_t> parse_deployment_id(std::string_view id);

  // Returns the asset id of a URL of the form {api_url}/repos/{repository}/releases/assets/{digits}.
  static std::optional<std::int64_t> parse_artifact_url(std::string_view url, std::string_view api_url, std::string_view repository);

  static constexpr std::string_view checksum_prefix = "sha256=";
  static constexpr std::size_t checksum_length = 71;
  static constexpr std::size_t commit_sha_length = 40;

private:
  static bool is_hex(std::string_view s);
  static std::optional<std::int64_t> parse_number(std::string_view s);
};

#endif // FIELD_VALIDATORS_HH
