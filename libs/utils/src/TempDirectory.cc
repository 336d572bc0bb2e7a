// Copyright (C) 2024 Rob Caelers <rob.caelers@gmail.com>
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

#include "utils/TempDirectory.hh"

#include <array>
#include <random>
#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

using namespace sitedeploy::utils;

TempDirectory::TempDirectory()
  : TempDirectory(std::filesystem::temp_directory_path())
{
}

TempDirectory::TempDirectory(const std::filesystem::path &parent)
{
  int tries = 0;
  while (true)
    {
      path = parent / ("sitedeploy-" + generate_random_string(random_string_length));

      if (!std::filesystem::exists(path))
        {
          break;
        }

      if (tries >= max_tries)
        {
          throw std::runtime_error("failed to create unique temp directory");
        }

      tries++;
    }

  spdlog::debug("create temp directory {}", path.string());
  std::filesystem::create_directories(path);
}

TempDirectory::~TempDirectory()
{
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec)
    {
      spdlog::warn("failed to remove temp directory {} ({})", path.string(), ec.message());
    }
}

std::filesystem::path
TempDirectory::get_path() const
{
  return path;
}

std::string
TempDirectory::generate_random_string(std::size_t len)
{
  static constexpr auto charset = std::to_array(
    "0123456789"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz");
  const size_t max_index = (charset.size() - 2);

  std::random_device rnd;
  std::mt19937 generator(rnd());
  std::uniform_int_distribution<size_t> distribution(0, max_index);

  auto randchar = [&distribution, &generator]() -> char { return charset[distribution(generator)]; };

  auto result = std::string(len, '\0');
  std::generate_n(begin(result), len, randchar);
  return result;
}
