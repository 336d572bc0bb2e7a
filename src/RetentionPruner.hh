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

#ifndef RETENTION_PRUNER_HH
#define RETENTION_PRUNER_HH

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <boost/outcome/std_result.hpp>

#include "http/HttpClient.hh"

#include "LogCollector.hh"

namespace outcome = boost::outcome_v2;

struct ReleaseAsset
{
  std::int64_t id{0};
  std::string name;
  std::chrono::system_clock::time_point updated_at;
};

// Caps the number of assets kept on the release of an environment.
class RetentionPruner
{
public:
  RetentionPruner(std::shared_ptr<sitedeploy::http::IHttpClient> http, std::string api_url, std::string token, LogCollector &collector);

  // Returns the number of deleted assets. The asset `protected_asset_id` is never deleted.
  boost::asio::awaitable<outcome::std_result<std::size_t>> prune(const std::string &repository,
                                                                 const std::string &environment,
                                                                 std::int64_t protected_asset_id);

  // All but the `keep` most recently updated assets, minus the protected one.
  std::vector<ReleaseAsset> select_outdated(std::vector<ReleaseAsset> assets, std::int64_t protected_asset_id) const;

  static constexpr std::size_t keep = 5;
  static constexpr std::size_t page_size = 100;
  static constexpr int max_pages = 100;

private:
  boost::asio::awaitable<outcome::std_result<std::int64_t>> find_release(const std::string &repository, const std::string &environment);
  boost::asio::awaitable<outcome::std_result<std::vector<ReleaseAsset>>> list_assets(const std::string &repository, std::int64_t release_id);
  std::vector<ReleaseAsset> parse_assets(const boost::json::array &items) const;

private:
  std::shared_ptr<sitedeploy::http::IHttpClient> http;
  std::string api_url;
  std::string token;
  std::shared_ptr<spdlog::logger> logger;
};

#endif // RETENTION_PRUNER_HH
