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

#include "sitedeploy/Configuration.hh"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/json.hpp>
#include <boost/outcome/try.hpp>
#include <spdlog/spdlog.h>

#include "utils/Logging.hh"

#include "FieldValidators.hh"

using namespace sitedeploy;

namespace
{
  class ConfigurationParser
  {
  public:
    explicit ConfigurationParser(std::filesystem::path base_dir)
      : base_dir(std::move(base_dir))
    {
    }

    outcome::std_result<Configuration> parse(const std::string &json);

  private:
    outcome::std_result<void> parse_app(const boost::json::object &obj, Configuration &config);
    outcome::std_result<void> parse_mail(const boost::json::object &obj, Configuration &config);
    outcome::std_result<std::string> parse_deployment_key(const boost::json::object &obj);
    outcome::std_result<RepositoryIdentity> parse_repository(const std::string &name, const boost::json::value &val);
    outcome::std_result<EnvironmentConfig> parse_environment(const std::string &repository,
                                                             const std::string &name,
                                                             const boost::json::value &val);

    outcome::std_result<std::string> get_string(const boost::json::object &obj, std::string_view key, std::string_view context);
    outcome::std_result<std::vector<std::string>> get_string_list(const boost::json::object &obj, std::string_view key);
    outcome::std_result<std::string> get_url(const boost::json::object &obj, std::string_view key, std::string default_value);
    outcome::std_result<std::string> get_secret(const boost::json::object &obj,
                                                std::string_view key,
                                                std::string_view file_key,
                                                std::string_view context);
    outcome::std_result<std::string> read_file(const std::filesystem::path &filename);

  private:
    std::filesystem::path base_dir;
    std::shared_ptr<spdlog::logger> logger{sitedeploy::utils::Logging::create("sitedeploy:config")};
  };

  outcome::std_result<Configuration> ConfigurationParser::parse(const std::string &json)
  {
    boost::json::error_code ec;
    boost::json::value root = boost::json::parse(json, ec);
    if (ec)
      {
        logger->error("failed to parse configuration ({})", ec.message());
        return ConfigErrc::MalformedJson;
      }
    if (!root.is_object())
      {
        logger->error("configuration must be a JSON object");
        return ConfigErrc::MalformedJson;
      }
    const auto &obj = root.as_object();

    Configuration config;
    BOOST_OUTCOME_TRY(auto api_url, get_url(obj, "api_url", config.api_url));
    config.api_url = std::move(api_url);
    BOOST_OUTCOME_TRY(auto web_url, get_url(obj, "web_url", config.web_url));
    config.web_url = std::move(web_url);
    BOOST_OUTCOME_TRY(auto log_recipients, get_string_list(obj, "log_recipients"));
    config.log_recipients = std::move(log_recipients);
    BOOST_OUTCOME_TRYV(parse_app(obj, config));
    BOOST_OUTCOME_TRYV(parse_mail(obj, config));
    BOOST_OUTCOME_TRY(auto deployment_key, parse_deployment_key(obj));
    config.deployment_key = std::move(deployment_key);

    const auto *repositories = obj.if_contains("repositories");
    if (repositories == nullptr || !repositories->is_object())
      {
        logger->error("configuration has no 'repositories' object");
        return ConfigErrc::MissingField;
      }

    for (const auto &[key, val]: repositories->as_object())
      {
        std::string name(key);
        BOOST_OUTCOME_TRY(auto repository, parse_repository(name, val));
        config.repositories.emplace(name, std::move(repository));
      }

    logger->info("loaded configuration for {} repositories", config.repositories.size());
    return config;
  }

  outcome::std_result<void> ConfigurationParser::parse_app(const boost::json::object &obj, Configuration &config)
  {
    const auto *app = obj.if_contains("app");
    if (app == nullptr || !app->is_object())
      {
        logger->error("configuration has no 'app' object");
        return ConfigErrc::MissingField;
      }

    BOOST_OUTCOME_TRY(auto client_id, get_string(app->as_object(), "client_id", "app"));
    config.app.client_id = std::move(client_id);
    BOOST_OUTCOME_TRY(auto private_key, get_secret(app->as_object(), "private_key", "private_key_file", "app"));
    config.app.private_key = std::move(private_key);
    return outcome::success();
  }

  outcome::std_result<void> ConfigurationParser::parse_mail(const boost::json::object &obj, Configuration &config)
  {
    const auto *mail = obj.if_contains("mail");
    if (mail == nullptr)
      {
        return outcome::success();
      }
    if (!mail->is_object())
      {
        logger->error("'mail' must be an object");
        return ConfigErrc::InvalidField;
      }

    const auto &mail_obj = mail->as_object();
    if (mail_obj.contains("sendmail"))
      {
        BOOST_OUTCOME_TRY(auto sendmail, get_string(mail_obj, "sendmail", "mail"));
        config.mail.sendmail = std::move(sendmail);
      }
    if (mail_obj.contains("from"))
      {
        BOOST_OUTCOME_TRY(auto from, get_string(mail_obj, "from", "mail"));
        config.mail.from = std::move(from);
      }
    return outcome::success();
  }

  outcome::std_result<std::string> ConfigurationParser::parse_deployment_key(const boost::json::object &obj)
  {
    if (obj.contains("deployment_key") || obj.contains("deployment_key_file"))
      {
        BOOST_OUTCOME_TRY(auto key, get_secret(obj, "deployment_key", "deployment_key_file", "configuration"));
        boost::algorithm::trim(key);
        return key;
      }

    const char *env = std::getenv("SITEDEPLOY_DEPLOYMENT_KEY");
    if (env != nullptr && *env != '\0')
      {
        return std::string(env);
      }

    logger->error("no deployment key configured");
    return ConfigErrc::MissingField;
  }

  outcome::std_result<RepositoryIdentity> ConfigurationParser::parse_repository(const std::string &name, const boost::json::value &val)
  {
    if (!FieldValidators::is_repository_name(name))
      {
        logger->error("invalid repository name '{}'", name);
        return ConfigErrc::InvalidField;
      }
    if (!val.is_object())
      {
        logger->error("repository '{}' must be an object", name);
        return ConfigErrc::InvalidField;
      }
    const auto &obj = val.as_object();

    RepositoryIdentity repository;
    repository.name = name;
    BOOST_OUTCOME_TRY(auto secret, get_secret(obj, "secret", "secret_file", name));
    repository.secret = std::move(secret);
    boost::algorithm::trim(repository.secret);
    if (repository.secret.empty())
      {
        logger->error("repository '{}' has an empty secret", name);
        return ConfigErrc::InvalidField;
      }
    BOOST_OUTCOME_TRY(auto log_recipients, get_string_list(obj, "log_recipients"));
    repository.log_recipients = std::move(log_recipients);

    const auto *environments = obj.if_contains("environments");
    if (environments == nullptr || !environments->is_object())
      {
        logger->error("repository '{}' has no 'environments' object", name);
        return ConfigErrc::MissingField;
      }

    for (const auto &[key, env_val]: environments->as_object())
      {
        std::string env_name(key);
        BOOST_OUTCOME_TRY(auto environment, parse_environment(name, env_name, env_val));
        repository.environments.emplace(env_name, std::move(environment));
      }
    return repository;
  }

  outcome::std_result<EnvironmentConfig> ConfigurationParser::parse_environment(const std::string &repository,
                                                                                const std::string &name,
                                                                                const boost::json::value &val)
  {
    if (!FieldValidators::is_name(name))
      {
        logger->error("invalid environment name '{}' in repository '{}'", name, repository);
        return ConfigErrc::InvalidField;
      }
    if (!val.is_object())
      {
        logger->error("environment '{}' of repository '{}' must be an object", name, repository);
        return ConfigErrc::InvalidField;
      }
    const auto &obj = val.as_object();
    auto context = repository + ":" + name;

    EnvironmentConfig environment;
    environment.name = name;
    BOOST_OUTCOME_TRY(auto deploy_url, get_string(obj, "deploy_url", context));
    environment.deploy_url = std::move(deploy_url);
    BOOST_OUTCOME_TRY(auto webroot, get_string(obj, "webroot", context));
    BOOST_OUTCOME_TRY(auto log_recipients, get_string_list(obj, "log_recipients"));
    environment.log_recipients = std::move(log_recipients);

    environment.webroot = std::filesystem::path(webroot).lexically_normal();
    if (!environment.webroot.is_absolute() || !environment.webroot.has_filename())
      {
        logger->error("webroot '{}' of {} must be an absolute path", webroot, context);
        return ConfigErrc::InvalidField;
      }
    return environment;
  }

  outcome::std_result<std::string> ConfigurationParser::get_string(const boost::json::object &obj,
                                                                   std::string_view key,
                                                                   std::string_view context)
  {
    const auto *val = obj.if_contains(key);
    if (val == nullptr)
      {
        logger->error("missing '{}' in {}", key, context);
        return ConfigErrc::MissingField;
      }
    if (!val->is_string() || val->as_string().empty())
      {
        logger->error("'{}' in {} must be a non-empty string", key, context);
        return ConfigErrc::InvalidField;
      }
    return std::string(val->as_string());
  }

  outcome::std_result<std::vector<std::string>> ConfigurationParser::get_string_list(const boost::json::object &obj, std::string_view key)
  {
    std::vector<std::string> ret;

    const auto *val = obj.if_contains(key);
    if (val == nullptr)
      {
        return ret;
      }
    if (!val->is_array())
      {
        logger->error("'{}' must be a list of strings", key);
        return ConfigErrc::InvalidField;
      }
    for (const auto &item: val->as_array())
      {
        if (!item.is_string())
          {
            logger->error("'{}' must be a list of strings", key);
            return ConfigErrc::InvalidField;
          }
        ret.emplace_back(item.as_string());
      }
    return ret;
  }

  outcome::std_result<std::string> ConfigurationParser::get_url(const boost::json::object &obj, std::string_view key, std::string default_value)
  {
    if (!obj.contains(key))
      {
        return default_value;
      }

    BOOST_OUTCOME_TRY(auto url, get_string(obj, key, "configuration"));
    if (!boost::algorithm::starts_with(url, "https://") && !boost::algorithm::starts_with(url, "http://"))
      {
        logger->error("'{}' must be an http(s) URL", key);
        return ConfigErrc::InvalidField;
      }
    while (url.ends_with('/'))
      {
        url.pop_back();
      }
    return url;
  }

  outcome::std_result<std::string> ConfigurationParser::get_secret(const boost::json::object &obj,
                                                                   std::string_view key,
                                                                   std::string_view file_key,
                                                                   std::string_view context)
  {
    if (obj.contains(key))
      {
        return get_string(obj, key, context);
      }
    if (obj.contains(file_key))
      {
        BOOST_OUTCOME_TRY(auto filename, get_string(obj, file_key, context));
        return read_file(filename);
      }

    logger->error("missing '{}' or '{}' in {}", key, file_key, context);
    return ConfigErrc::MissingField;
  }

  outcome::std_result<std::string> ConfigurationParser::read_file(const std::filesystem::path &filename)
  {
    auto path = filename.is_absolute() ? filename : base_dir / filename;

    std::ifstream file(path.string(), std::ios::binary);
    if (!file)
      {
        logger->error("failed to read '{}'", path.string());
        return ConfigErrc::FileNotFound;
      }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
  }
} // namespace

outcome::std_result<Configuration>
Configuration::load_from_file(const std::filesystem::path &filename)
{
  auto logger = sitedeploy::utils::Logging::create("sitedeploy:config");

  std::ifstream file(filename.string(), std::ios::binary);
  if (!file)
    {
      logger->error("failed to open configuration '{}'", filename.string());
      return ConfigErrc::FileNotFound;
    }
  std::stringstream ss;
  ss << file.rdbuf();

  return load_from_string(ss.str(), filename.parent_path());
}

outcome::std_result<Configuration>
Configuration::load_from_string(const std::string &json, const std::filesystem::path &base_dir)
{
  ConfigurationParser parser(base_dir);
  return parser.parse(json);
}
