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

#include "ApiClient.hh"

#include <utility>

#include <boost/algorithm/string/predicate.hpp>

ApiClient::ApiClient(std::shared_ptr<sitedeploy::http::IHttpClient> http,
                     std::string api_url,
                     std::string token,
                     std::shared_ptr<spdlog::logger> logger)
  : http(std::move(http))
  , api_url(std::move(api_url))
  , token(std::move(token))
  , logger(std::move(logger))
{
}

std::string
ApiClient::make_url(const std::string &path) const
{
  if (boost::algorithm::starts_with(path, "https://") || boost::algorithm::starts_with(path, "http://"))
    {
      return path;
    }
  return api_url + path;
}

sitedeploy::http::Headers
ApiClient::make_headers(const std::string &accept) const
{
  sitedeploy::http::Headers headers{{"Accept", accept}, {"X-GitHub-Api-Version", api_version}};
  if (!token.empty())
    {
      headers["Authorization"] = "Bearer " + token;
    }
  return headers;
}

boost::asio::awaitable<outcome::std_result<ApiResponse>>
ApiClient::get(const std::string &path)
{
  co_return co_await send(sitedeploy::http::Request{.method = boost::beast::http::verb::get, .url = make_url(path), .headers = make_headers()});
}

boost::asio::awaitable<outcome::std_result<ApiResponse>>
ApiClient::post(const std::string &path, const boost::json::value &body)
{
  auto headers = make_headers();
  headers["Content-Type"] = "application/json";
  co_return co_await send(sitedeploy::http::Request{.method = boost::beast::http::verb::post,
                                                    .url = make_url(path),
                                                    .headers = std::move(headers),
                                                    .body = boost::json::serialize(body)});
}

boost::asio::awaitable<outcome::std_result<ApiResponse>>
ApiClient::remove(const std::string &path)
{
  co_return co_await send(
    sitedeploy::http::Request{.method = boost::beast::http::verb::delete_, .url = make_url(path), .headers = make_headers()});
}

boost::asio::awaitable<outcome::std_result<ApiResponse>>
ApiClient::send(sitedeploy::http::Request request)
{
  auto rc = co_await http->execute(request);
  if (!rc)
    {
      logger->error("{} {} failed ({})", std::string(boost::beast::http::to_string(request.method)), request.url, rc.error().message());
      co_return rc.as_failure();
    }

  auto [status, text] = rc.value();
  ApiResponse response{status, std::move(text), {}};
  if (!response.text.empty())
    {
      boost::json::error_code ec;
      response.json = boost::json::parse(response.text, ec);
      if (ec)
        {
          logger->debug("response from {} is not JSON ({})", request.url, ec.message());
          response.json = nullptr;
        }
    }

  logger->debug("{} {} -> {}", std::string(boost::beast::http::to_string(request.method)), request.url, status);
  co_return response;
}
