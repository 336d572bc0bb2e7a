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

#ifndef SITEDEPLOY_CONFIGURATION_HH
#define SITEDEPLOY_CONFIGURATION_HH

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <boost/outcome/std_result.hpp>

#include "sitedeploy/SiteDeployErrors.hh"

namespace sitedeploy
{
  namespace outcome = boost::outcome_v2;

  struct EnvironmentConfig
  {
    std::string name;
    std::string deploy_url;
    std::filesystem::path webroot;
    std::vector<std::string> log_recipients;
  };

  struct RepositoryIdentity
  {
    std::string name;
    std::string secret;
    std::vector<std::string> log_recipients;
    std::map<std::string, EnvironmentConfig> environments;
  };

  struct AppConfig
  {
    std::string client_id;
    std::string private_key;
  };

  struct MailConfig
  {
    std::string sendmail{"/usr/sbin/sendmail"};
    std::string from;
  };

  struct Configuration
  {
    std::string api_url{"https://api.github.com"};
    std::string web_url{"https://github.com"};
    AppConfig app;
    std::string deployment_key;
    MailConfig mail;
    std::vector<std::string> log_recipients;
    std::map<std::string, RepositoryIdentity> repositories;

    // Relative key and secret files are resolved against the directory of the configuration file.
    static outcome::std_result<Configuration> load_from_file(const std::filesystem::path &filename);
    static outcome::std_result<Configuration> load_from_string(const std::string &json,
                                                               const std::filesystem::path &base_dir = {});
  };
} // namespace sitedeploy

#endif // SITEDEPLOY_CONFIGURATION_HH
