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

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "http/HttpClient.hh"
#include "sitedeploy/DeploymentRequest.hh"
#include "sitedeploy/SiteDeployErrors.hh"
#include "utils/Logging.hh"

#include "DeploymentManager.hh"
#include "FieldValidators.hh"
#include "LogCollector.hh"
#include "MailTransport.hh"

namespace po = boost::program_options;

namespace
{
  constexpr int exit_failure = 1;
  constexpr int exit_usage = 2;
  constexpr std::chrono::seconds status_timeout{10};

  std::string get_env(const char *name)
  {
    const char *value = std::getenv(name);
    return value != nullptr ? value : "";
  }

  bool is_web_url(const std::string &url)
  {
    return url.starts_with("https://") || url.starts_with("http://");
  }

  std::string strip_trailing_slash(std::string url)
  {
    while (url.ends_with('/'))
      {
        url.pop_back();
      }
    return url;
  }
} // namespace

int
main(int argc, char *argv[])
{
  std::string api_url;
  std::string web_url;
  std::string sendmail;
  std::string mail_from;
  int lock_timeout = 0;
  std::string log_level;
  std::vector<std::string> arguments;

  po::options_description desc("Usage: sitedeploy-deploy [options] WEBROOT REPOSITORY ENVIRONMENT DEPLOY_URL DEPLOYMENT_ID "
                               "COMMIT_SHA ARTIFACT_URL ARTIFACT_CHECKSUM [EMAIL...]");
  desc.add_options()("help,h", "show this help")                                                             //
    ("api-url", po::value<std::string>(&api_url)->default_value("https://api.github.com"), "API base URL")             //
    ("web-url", po::value<std::string>(&web_url)->default_value("https://github.com"), "web base URL")                 //
    ("sendmail", po::value<std::string>(&sendmail)->default_value("/usr/sbin/sendmail"), "sendmail binary")           //
    ("mail-from", po::value<std::string>(&mail_from), "sender of the deployment log")                                 //
    ("lock-timeout", po::value<int>(&lock_timeout)->default_value(300), "seconds to wait for the deployment lock")   //
    ("log-level", po::value<std::string>(&log_level)->default_value("info"), "trace, debug, info, warn, error");

  po::options_description hidden;
  hidden.add_options()("arguments", po::value<std::vector<std::string>>(&arguments));

  po::options_description all;
  all.add(desc).add(hidden);

  po::positional_options_description positional;
  positional.add("arguments", -1);

  po::variables_map vm;
  try
    {
      po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
      po::notify(vm);
    }
  catch (po::error &e)
    {
      std::cerr << e.what() << "\n" << desc << "\n";
      return exit_usage;
    }

  if (vm.count("help") > 0)
    {
      std::cout << desc << "\n";
      return 0;
    }

  sitedeploy::utils::Logging::setup("sitedeploy", spdlog::level::from_str(log_level));

  if (arguments.size() < 8)
    {
      std::cerr << desc << "\n";
      return exit_usage;
    }

  api_url = strip_trailing_slash(api_url);
  web_url = strip_trailing_slash(web_url);

  sitedeploy::DeploymentRequest request;
  request.webroot = std::filesystem::path(arguments[0]).lexically_normal();
  request.repository = arguments[1];
  request.environment = arguments[2];
  request.deploy_url = arguments[3];
  request.commit_sha = arguments[5];
  request.artifact.url = arguments[6];
  request.artifact.checksum = arguments[7];
  request.log_recipients.assign(arguments.begin() + 8, arguments.end());

  std::vector<std::string> problems;
  if (!request.webroot.is_absolute() || !request.webroot.has_filename())
    {
      problems.emplace_back("WEBROOT must be an absolute path");
    }
  if (!FieldValidators::is_repository_name(request.repository))
    {
      problems.emplace_back("REPOSITORY must be owner/name");
    }
  if (!FieldValidators::is_name(request.environment))
    {
      problems.emplace_back("invalid ENVIRONMENT");
    }
  if (!is_web_url(request.deploy_url))
    {
      problems.emplace_back("DEPLOY_URL must be an http(s) URL");
    }
  if (auto id = FieldValidators::parse_deployment_id(arguments[4]))
    {
      request.deployment_id = *id;
    }
  else
    {
      problems.emplace_back("DEPLOYMENT_ID must be a positive number");
    }
  if (!FieldValidators::is_commit_sha(request.commit_sha))
    {
      problems.emplace_back("COMMIT_SHA must be 40 hexadecimal digits");
    }
  if (auto asset_id = FieldValidators::parse_artifact_url(request.artifact.url, api_url, request.repository))
    {
      request.artifact.name = fmt::format("asset-{}", *asset_id);
    }
  else
    {
      problems.emplace_back(fmt::format("ARTIFACT_URL must be {}/repos/{}/releases/assets/<id>", api_url, request.repository));
    }
  if (!FieldValidators::is_checksum(request.artifact.checksum))
    {
      problems.emplace_back("ARTIFACT_CHECKSUM must be sha256=<64 hexadecimal digits>");
    }
  if (lock_timeout <= 0)
    {
      problems.emplace_back("--lock-timeout must be positive");
    }

  DeploymentSettings settings;
  settings.api_url = api_url;
  settings.web_url = web_url;
  settings.token = get_env("SITEDEPLOY_API_TOKEN");
  settings.deployment_key = get_env("SITEDEPLOY_DEPLOYMENT_KEY");
  settings.lock_timeout = std::chrono::seconds{lock_timeout};
  if (settings.token.empty())
    {
      problems.emplace_back("SITEDEPLOY_API_TOKEN is not set");
    }
  if (settings.deployment_key.empty())
    {
      problems.emplace_back("SITEDEPLOY_DEPLOYMENT_KEY is not set");
    }

  if (!problems.empty())
    {
      for (const auto &problem: problems)
        {
          spdlog::error("{}", problem);
        }
      return exit_usage;
    }

  auto http = std::make_shared<sitedeploy::http::HttpClient>();
  auto status_http = std::make_shared<sitedeploy::http::HttpClient>();
  status_http->options().set_timeout(status_timeout);
  auto transport = std::make_shared<SendmailTransport>(sendmail, mail_from);

  auto description = fmt::format("[sitedeploy] {} {} deployment {}", request.repository, request.environment, request.deployment_id);
  LogCollector collector(transport, request.log_recipients, description);
  auto manager = std::make_shared<DeploymentManager>(std::move(request), std::move(settings), http, status_http, collector);

  boost::asio::io_context ioc;
  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([manager](const boost::system::error_code &ec, int signal) {
    if (!ec)
      {
        spdlog::warn("received signal {}, abandoning deployment", signal);
        manager->cancel();
      }
  });

  outcome::std_result<void> rc = sitedeploy::DeployErrc::InternalError;
  boost::asio::co_spawn(
    ioc,
    [&]() -> boost::asio::awaitable<void> {
      try
        {
          rc = co_await manager->deploy();
        }
      catch (std::exception &e)
        {
          spdlog::error("deployment aborted ({})", e.what());
          rc = sitedeploy::DeployErrc::InternalError;
        }
      signals.cancel();
    },
    boost::asio::detached);
  ioc.run();

  collector.flush(rc.has_value());
  return rc ? 0 : exit_failure;
}
