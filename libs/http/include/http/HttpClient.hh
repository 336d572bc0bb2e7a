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

#ifndef NET_HTTP_HTTPCLIENT_HH
#define NET_HTTP_HTTPCLIENT_HH

#include <functional>
#include <map>
#include <string>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/outcome/std_result.hpp>

#include "utils/Logging.hh"

#include "http/Options.hh"
#include "http/HttpClientErrors.hh"

namespace outcome = boost::outcome_v2;

namespace sitedeploy::http
{
  using Response = std::pair<int, std::string>;
  using Headers = std::map<std::string, std::string>;

  // Receives successive pieces of a response body. Returning a failure aborts the transfer.
  using ChunkCallback = std::function<outcome::std_result<void>(std::string_view chunk)>;

  struct Request
  {
    boost::beast::http::verb method{boost::beast::http::verb::get};
    std::string url;
    Headers headers;
    std::string body;
  };

  class IHttpClient
  {
  public:
    virtual ~IHttpClient() = default;

    virtual Options &options() = 0;

    virtual boost::asio::awaitable<outcome::std_result<Response>> execute(Request request) = 0;

    // Streams a successful response body through `cb`; the returned body is only
    // filled for unsuccessful responses.
    virtual boost::asio::awaitable<outcome::std_result<Response>> download(Request request, ChunkCallback cb) = 0;
  };

  class HttpClient : public IHttpClient
  {
  public:
    HttpClient() = default;

    Options &options() override
    {
      return options_;
    }

    boost::asio::awaitable<outcome::std_result<Response>> execute(Request request) override;
    boost::asio::awaitable<outcome::std_result<Response>> download(Request request, ChunkCallback cb) override;

  private:
    sitedeploy::http::Options options_;
  };
} // namespace sitedeploy::http
#endif // NET_HTTP_HTTPCLIENT_HH
