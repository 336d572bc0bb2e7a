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

#include "RetentionPruner.hh"

#include <algorithm>
#include <exception>
#include <utility>

#include <boost/outcome/try.hpp>

#include "sitedeploy/SiteDeployErrors.hh"
#include "utils/DateUtils.hh"

#include "ApiClient.hh"

using namespace sitedeploy;

RetentionPruner::RetentionPruner(std::shared_ptr<sitedeploy::http::IHttpClient> http,
                                 std::string api_url,
                                 std::string token,
                                 LogCollector &collector)
  : http(std::move(http))
  , api_url(std::move(api_url))
  , token(std::move(token))
  , logger(collector.create_logger("sitedeploy:prune"))
{
}

std::vector<ReleaseAsset>
RetentionPruner::select_outdated(std::vector<ReleaseAsset> assets, std::int64_t protected_asset_id) const
{
  if (assets.size() <= keep)
    {
      logger->info("{} assets, nothing to prune", assets.size());
      return {};
    }

  std::stable_sort(assets.begin(), assets.end(), [](const auto &a, const auto &b) { return a.updated_at < b.updated_at; });
  assets.resize(assets.size() - keep);

  auto it = std::find_if(assets.begin(), assets.end(), [protected_asset_id](const auto &a) { return a.id == protected_asset_id; });
  if (it != assets.end())
    {
      logger->warn("asset {} ({}) of the current deployment would be pruned, keeping it", it->id, it->name);
      assets.erase(it);
    }
  return assets;
}

boost::asio::awaitable<outcome::std_result<std::size_t>>
RetentionPruner::prune(const std::string &repository, const std::string &environment, std::int64_t protected_asset_id)
{
  BOOST_OUTCOME_CO_TRY(auto release_id, co_await find_release(repository, environment));
  BOOST_OUTCOME_CO_TRY(auto assets, co_await list_assets(repository, release_id));

  ApiClient api(http, api_url, token, logger);

  std::size_t deleted = 0;
  for (const auto &asset: select_outdated(std::move(assets), protected_asset_id))
    {
      auto rc = co_await api.remove("/repos/" + repository + "/releases/assets/" + std::to_string(asset.id));
      if (!rc || rc.value().status != 204)
        {
          logger->warn("failed to delete asset {} ({})", asset.id, asset.name);
          continue;
        }
      logger->info("deleted asset {} ({})", asset.id, asset.name);
      deleted++;
    }
  co_return deleted;
}

boost::asio::awaitable<outcome::std_result<std::int64_t>>
RetentionPruner::find_release(const std::string &repository, const std::string &environment)
{
  ApiClient api(http, api_url, token, logger);

  auto rc = co_await api.get("/repos/" + repository + "/releases/tags/" + environment);
  if (!rc)
    {
      co_return rc.as_failure();
    }

  const auto &response = rc.value();
  const boost::json::value *id = nullptr;
  if (response.status == 200 && response.json.is_object())
    {
      id = response.json.as_object().if_contains("id");
    }
  if (id == nullptr || !id->is_int64())
    {
      logger->warn("no release tagged {} in {} ({})", environment, repository, response.status);
      co_return DeployErrc::InternalError;
    }
  co_return id->as_int64();
}

boost::asio::awaitable<outcome::std_result<std::vector<ReleaseAsset>>>
RetentionPruner::list_assets(const std::string &repository, std::int64_t release_id)
{
  ApiClient api(http, api_url, token, logger);

  std::vector<ReleaseAsset> assets;
  for (int page = 1;; page++)
    {
      if (page > max_pages)
        {
          logger->warn("release {} has more than {} pages of assets, pruning the first {}", release_id, max_pages, assets.size());
          break;
        }

      auto rc = co_await api.get("/repos/" + repository + "/releases/" + std::to_string(release_id) + "/assets?per_page="
                                 + std::to_string(page_size) + "&page=" + std::to_string(page));
      if (!rc)
        {
          co_return rc.as_failure();
        }

      const auto &response = rc.value();
      if (response.status != 200 || !response.json.is_array())
        {
          logger->warn("failed to list assets of release {} ({})", release_id, response.status);
          co_return DeployErrc::InternalError;
        }

      const auto &items = response.json.as_array();
      auto parsed = parse_assets(items);
      assets.insert(assets.end(), parsed.begin(), parsed.end());

      // A short page is the last one.
      if (items.size() < page_size)
        {
          break;
        }
    }
  co_return assets;
}

std::vector<ReleaseAsset>
RetentionPruner::parse_assets(const boost::json::array &items) const
{
  std::vector<ReleaseAsset> assets;
  for (const auto &item: items)
    {
      if (!item.is_object())
        {
          continue;
        }
      const auto &obj = item.as_object();
      const auto *id = obj.if_contains("id");
      const auto *name = obj.if_contains("name");
      const auto *updated_at = obj.if_contains("updated_at");
      if (id == nullptr || !id->is_int64() || updated_at == nullptr || !updated_at->is_string())
        {
          logger->warn("ignoring malformed release asset");
          continue;
        }

      try
        {
          ReleaseAsset asset;
          asset.id = id->as_int64();
          asset.name = (name != nullptr && name->is_string()) ? std::string(name->as_string()) : std::string();
          asset.updated_at = sitedeploy::utils::DateUtils::parse_time_point(std::string(updated_at->as_string()));
          assets.push_back(std::move(asset));
        }
      catch (std::exception &e)
        {
          logger->warn("ignoring asset {} with invalid date ({})", id->as_int64(), e.what());
        }
    }
  return assets;
}
