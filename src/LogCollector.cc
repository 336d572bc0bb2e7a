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

#include "LogCollector.hh"

#include <utility>

LogCollector::LogCollector(std::shared_ptr<MailTransport> transport, std::vector<std::string> recipients, std::string description)
  : transport(std::move(transport))
  , recipients(std::move(recipients))
  , description(std::move(description))
  , sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(max_lines))
{
  sink->set_pattern(pattern);
}

std::shared_ptr<spdlog::logger>
LogCollector::create_logger(std::string domain)
{
  return sitedeploy::utils::Logging::create(std::move(domain), {sink});
}

std::vector<std::string>
LogCollector::get_lines() const
{
  auto lines = sink->last_formatted();
  for (auto &line: lines)
    {
      while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        {
          line.pop_back();
        }
    }
  return lines;
}

bool
LogCollector::is_flushed() const
{
  return flushed;
}

void
LogCollector::flush(bool success)
{
  std::call_once(flushed_flag, [&]() {
    flushed = true;
    if (!transport)
      {
        return;
      }

    auto subject = description + (success ? " succeeded" : " failed");
    auto rc = transport->send(recipients, subject, get_lines());
    if (!rc)
      {
        logger->error("failed to send deployment log ({})", rc.error().message());
      }
  });
}
