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

#include "ArtifactFetcher.hh"

#include <fstream>
#include <utility>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/outcome/try.hpp>

#include "crypto/Hmac.hh"
#include "sitedeploy/SiteDeployErrors.hh"
#include "utils/TempDirectory.hh"

#include "ApiClient.hh"

using namespace sitedeploy;

ArtifactFetcher::ArtifactFetcher(std::shared_ptr<sitedeploy::http::IHttpClient> http,
                                 std::string api_url,
                                 std::string token,
                                 std::string deployment_key,
                                 LogCollector &collector)
  : http(std::move(http))
  , api_url(std::move(api_url))
  , token(std::move(token))
  , deployment_key(std::move(deployment_key))
  , logger(collector.create_logger("sitedeploy:fetch"))
{
}

boost::asio::awaitable<outcome::std_result<std::unique_ptr<ScopedFile>>>
ArtifactFetcher::fetch(const ArtifactRef &artifact, const std::filesystem::path &directory)
{
  auto filename = directory / (".sitedeploy-download-" + sitedeploy::utils::TempDirectory::generate_random_string(10));
  auto file = std::make_unique<ScopedFile>(filename);

  BOOST_OUTCOME_CO_TRY(auto size, co_await probe_size(artifact));

  logger->info("downloading {} ({} bytes) to {}", artifact.name, size, filename.string());
  BOOST_OUTCOME_CO_TRYV(co_await download(artifact, file->get_path(), size));

  logger->info("artifact {} verified", artifact.name);
  co_return std::move(file);
}

boost::asio::awaitable<outcome::std_result<std::uint64_t>>
ArtifactFetcher::probe_size(const ArtifactRef &artifact)
{
  ApiClient api(http, api_url, token, logger);

  auto rc = co_await api.get(artifact.url);
  if (!rc)
    {
      co_return DeployErrc::DownloadFailed;
    }

  const auto &response = rc.value();
  if (response.status != 200 || !response.json.is_object())
    {
      logger->error("failed to query artifact {} ({} {})", artifact.url, response.status, response.text);
      co_return DeployErrc::DownloadFailed;
    }

  const auto *size = response.json.as_object().if_contains("size");
  std::uint64_t value = 0;
  if (size != nullptr && size->is_int64() && size->as_int64() >= 0)
    {
      value = static_cast<std::uint64_t>(size->as_int64());
    }
  else if (size != nullptr && size->is_uint64())
    {
      value = size->as_uint64();
    }
  else
    {
      logger->error("artifact {} has no size", artifact.url);
      co_return DeployErrc::DownloadFailed;
    }

  if (value > max_artifact_size)
    {
      logger->error("artifact {} is too large ({} bytes, limit {})", artifact.url, value, max_artifact_size);
      co_return DeployErrc::ArtifactTooLarge;
    }
  co_return value;
}

boost::asio::awaitable<outcome::std_result<void>>
ArtifactFetcher::download(const ArtifactRef &artifact, const std::filesystem::path &filename, std::uint64_t expected_size)
{
  std::ofstream out(filename.string(), std::ofstream::binary | std::ofstream::trunc);
  if (!out)
    {
      logger->error("failed to create {}", filename.string());
      co_return DeployErrc::DownloadFailed;
    }

  sitedeploy::crypto::Hmac hmac(deployment_key);
  std::uint64_t received = 0;

  ApiClient api(http, api_url, token, logger);
  sitedeploy::http::Request request{.url = artifact.url, .headers = api.make_headers("application/octet-stream")};

  auto rc = co_await http->download(request, [&](std::string_view chunk) -> outcome::std_result<void> {
    received += chunk.size();
    if (received > expected_size || received > max_artifact_size)
      {
        logger->error("artifact exceeds its announced size of {} bytes", expected_size);
        return DeployErrc::ArtifactTooLarge;
      }

    BOOST_OUTCOME_TRYV(hmac.update(chunk));

    out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    if (!out)
      {
        logger->error("failed to write {}", filename.string());
        return DeployErrc::DownloadFailed;
      }
    return outcome::success();
  });

  if (!rc)
    {
      logger->error("failed to download {} ({})", artifact.url, rc.error().message());
      if (rc.error() == DeployErrc::ArtifactTooLarge)
        {
          co_return rc.as_failure();
        }
      co_return DeployErrc::DownloadFailed;
    }

  auto [status, content] = rc.value();
  if (status != 200)
    {
      logger->error("failed to download {} ({} {})", artifact.url, status, content);
      co_return DeployErrc::DownloadFailed;
    }

  out.close();
  if (!out)
    {
      logger->error("failed to write {}", filename.string());
      co_return DeployErrc::DownloadFailed;
    }

  if (received != expected_size)
    {
      logger->error("artifact truncated ({} of {} bytes)", received, expected_size);
      co_return DeployErrc::DownloadFailed;
    }

  auto digest = hmac.hex_digest();
  if (!digest)
    {
      logger->error("failed to compute artifact checksum ({})", digest.error().message());
      co_return DeployErrc::InternalError;
    }

  auto expected = boost::algorithm::to_lower_copy(artifact.checksum);
  if (!sitedeploy::crypto::constant_time_equals("sha256=" + digest.value(), expected))
    {
      logger->error("checksum mismatch for {}", artifact.name);
      co_return DeployErrc::IntegrityCheckFailed;
    }

  co_return outcome::success();
}
