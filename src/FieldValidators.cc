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

#include "FieldValidators.hh"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

#include <boost/algorithm/string/predicate.hpp>

bool
FieldValidators::is_hex(std::string_view s)
{
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

std::optional<std::int64_t>
FieldValidators::parse_number(std::string_view s)
{
  constexpr std::size_t max_digits = 18;
  if (s.empty() || s.size() > max_digits
      || !std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }))
    {
      return {};
    }

  std::int64_t value{0};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size())
    {
      return {};
    }
  return value;
}

bool
FieldValidators::is_commit_sha(std::string_view sha)
{
  return sha.size() == commit_sha_length && is_hex(sha);
}

bool
FieldValidators::is_checksum(std::string_view checksum)
{
  return checksum.size() == checksum_length && boost::algorithm::starts_with(checksum, checksum_prefix)
         && is_hex(checksum.substr(checksum_prefix.size()));
}

bool
FieldValidators::is_name(std::string_view name)
{
  if (name.empty() || name == "." || name == "..")
    {
      return false;
    }
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '_' || c == '-';
  });
}

bool
FieldValidators::is_repository_name(std::string_view name)
{
  auto pos = name.find('/');
  if (pos == std::string_view::npos)
    {
      return false;
    }
  return is_name(name.substr(0, pos)) && is_name(name.substr(pos + 1));
}

std::optional<std::int64_t>
FieldValidators::parse_deployment_id(std::string_view id)
{
  auto value = parse_number(id);
  if (!value || *value <= 0)
    {
      return {};
    }
  return value;
}

std::optional<std::int64_t>
FieldValidators::parse_artifact_url(std::string_view url, std::string_view api_url, std::string_view repository)
{
  while (!api_url.empty() && api_url.back() == '/')
    {
      api_url.remove_suffix(1);
    }

  if (!boost::algorithm::starts_with(api_url, "https://") || !is_repository_name(repository))
    {
      return {};
    }

  std::string prefix = std::string(api_url) + "/repos/" + std::string(repository) + "/releases/assets/";
  if (!boost::algorithm::starts_with(url, prefix))
    {
      return {};
    }
  return parse_number(url.substr(prefix.size()));
}
