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

#ifndef ARTIFACT_FETCHER_HH
#define ARTIFACT_FETCHER_HH

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/outcome/std_result.hpp>

#include "http/HttpClient.hh"
#include "sitedeploy/DeploymentRequest.hh"

#include "LogCollector.hh"
#include "ScopedFile.hh"

namespace outcome = boost::outcome_v2;

// Downloads a release asset while verifying its keyed checksum.
class ArtifactFetcher
{
public:
  ArtifactFetcher(std::shared_ptr<sitedeploy::http::IHttpClient> http,
                  std::string api_url,
                  std::string token,
                  std::string deployment_key,
                  LogCollector &collector);

  // Downloads into a new file in `directory`. The file is removed when the returned handle is
  // destroyed, and immediately on any failure.
  boost::asio::awaitable<outcome::std_result<std::unique_ptr<ScopedFile>>> fetch(const sitedeploy::ArtifactRef &artifact,
                                                                                  const std::filesystem::path &directory);

  static constexpr std::uint64_t max_artifact_size = std::uint64_t{1} << 32;

private:
  boost::asio::awaitable<outcome::std_result<std::uint64_t>> probe_size(const sitedeploy::ArtifactRef &artifact);
  boost::asio::awaitable<outcome::std_result<void>> download(const sitedeploy::ArtifactRef &artifact,
                                                             const std::filesystem::path &filename,
                                                             std::uint64_t expected_size);

private:
  std::shared_ptr<sitedeploy::http::IHttpClient> http;
  std::string api_url;
  std::string token;
  std::string deployment_key;
  std::shared_ptr<spdlog::logger> logger;
};

#endif // ARTIFACT_FETCHER_HH
