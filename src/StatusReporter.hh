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

#ifndef STATUS_REPORTER_HH
#define STATUS_REPORTER_HH

#include <memory>
#include <string>

#include <boost/asio.hpp>

#include "http/HttpClient.hh"
#include "sitedeploy/DeploymentRequest.hh"

#include "LogCollector.hh"

// Posts deployment lifecycle states to the source-control host. Failures are logged only.
class StatusReporter
{
public:
  StatusReporter(std::shared_ptr<sitedeploy::http::IHttpClient> http,
                 std::string api_url,
                 std::string web_url,
                 std::string token,
                 LogCollector &collector);

  boost::asio::awaitable<void> report(const sitedeploy::DeploymentRequest &request,
                                      sitedeploy::DeploymentState state,
                                      std::string description);

  std::string make_log_url(const sitedeploy::DeploymentRequest &request) const;

  // Cuts `description` to at most max_description_length bytes without splitting a UTF-8 sequence.
  static std::string truncate_description(std::string description);

  static constexpr std::size_t max_description_length = 140;

private:
  std::shared_ptr<sitedeploy::http::IHttpClient> http;
  std::string api_url;
  std::string web_url;
  std::string token;
  std::shared_ptr<spdlog::logger> logger;
};

#endif // STATUS_REPORTER_HH
