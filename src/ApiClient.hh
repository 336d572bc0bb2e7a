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

#ifndef API_CLIENT_HH
#define API_CLIENT_HH

#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <boost/outcome/std_result.hpp>

#include "http/HttpClient.hh"
#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

struct ApiResponse
{
  int status{0};
  std::string text;
  boost::json::value json;
};

// Bearer-authenticated JSON calls against the source-control host's REST API.
class ApiClient
{
public:
  ApiClient(std::shared_ptr<sitedeploy::http::IHttpClient> http,
            std::string api_url,
            std::string token,
            std::shared_ptr<spdlog::logger> logger);

  boost::asio::awaitable<outcome::std_result<ApiResponse>> get(const std::string &path);
  boost::asio::awaitable<outcome::std_result<ApiResponse>> post(const std::string &path, const boost::json::value &body);
  boost::asio::awaitable<outcome::std_result<ApiResponse>> remove(const std::string &path);

  sitedeploy::http::Headers make_headers(const std::string &accept = json_media_type) const;

  // `path` is relative to the API root; absolute http(s) URLs are used as is.
  std::string make_url(const std::string &path) const;

  static constexpr auto json_media_type = "application/vnd.github+json";
  static constexpr auto api_version = "2022-11-28";

private:
  boost::asio::awaitable<outcome::std_result<ApiResponse>> send(sitedeploy::http::Request request);

private:
  std::shared_ptr<sitedeploy::http::IHttpClient> http;
  std::string api_url;
  std::string token;
  std::shared_ptr<spdlog::logger> logger;
};

#endif // API_CLIENT_HH
