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

#include "utils/Logging.hh"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#if SPDLOG_VERSION >= 10801
#  include <spdlog/cfg/env.h>
#endif

using namespace sitedeploy::utils;

std::shared_ptr<spdlog::logger>
Logging::create(std::string domain)
{
  return spdlog::default_logger()->clone(domain);
}

std::shared_ptr<spdlog::logger>
Logging::create(std::string domain, std::vector<spdlog::sink_ptr> extra_sinks)
{
  auto base = spdlog::default_logger();

  std::vector<spdlog::sink_ptr> sinks(base->sinks().begin(), base->sinks().end());
  sinks.insert(sinks.end(), extra_sinks.begin(), extra_sinks.end());

  auto logger = std::make_shared<spdlog::logger>(std::move(domain), sinks.begin(), sinks.end());
  logger->set_level(base->level());
  logger->flush_on(spdlog::level::err);
  return logger;
}

void
Logging::setup(const std::string &name, spdlog::level::level_enum level, const std::optional<std::filesystem::path> &log_file)
{
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (log_file)
    {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file->string(), false));
    }

  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->flush_on(spdlog::level::err);
  spdlog::set_default_logger(logger);

  spdlog::set_level(level);
  spdlog::set_pattern(pattern);

#if SPDLOG_VERSION >= 10801
  spdlog::cfg::load_env_levels();
#endif
}
