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

#ifndef ARCHIVE_EXTRACTOR_HH
#define ARCHIVE_EXTRACTOR_HH

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/outcome/std_result.hpp>

#include "LogCollector.hh"

namespace outcome = boost::outcome_v2;

// Lists and unpacks (optionally compressed) tar archives with the system tar.
class ArchiveExtractor
{
public:
  explicit ArchiveExtractor(LogCollector &collector, std::filesystem::path tar = {});

  boost::asio::awaitable<outcome::std_result<std::vector<std::string>>> list(const std::filesystem::path &archive);

  // Ownership, permissions, extended attributes and ACLs stored in the archive are ignored;
  // existing files are never replaced.
  boost::asio::awaitable<outcome::std_result<void>> extract(const std::filesystem::path &archive, const std::filesystem::path &directory);

private:
  outcome::std_result<std::vector<std::string>> run_list(const std::filesystem::path &archive);
  outcome::std_result<void> run_extract(const std::filesystem::path &archive, const std::filesystem::path &directory);

private:
  std::filesystem::path tar;
  std::shared_ptr<spdlog::logger> logger;
};

#endif // ARCHIVE_EXTRACTOR_HH
