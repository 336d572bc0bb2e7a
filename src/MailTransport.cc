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

#include "MailTransport.hh"

#include <exception>
#include <utility>

#include <boost/algorithm/string/join.hpp>
#include <boost/process.hpp>

#include "sitedeploy/SiteDeployErrors.hh"

SendmailTransport::SendmailTransport(std::string sendmail, std::string from)
  : sendmail(std::move(sendmail))
  , from(std::move(from))
{
}

std::string
SendmailTransport::compose(const std::vector<std::string> &recipients, const std::string &subject, const std::vector<std::string> &lines) const
{
  std::string message;
  if (!from.empty())
    {
      message += "From: " + from + "\n";
    }
  message += "To: " + boost::algorithm::join(recipients, ", ") + "\n";
  message += "Subject: " + subject + "\n";
  message += "MIME-Version: 1.0\n";
  message += "Content-Type: text/plain; charset=utf-8\n";
  message += "Content-Transfer-Encoding: 8bit\n";
  message += "\n";
  for (const auto &line: lines)
    {
      message += line + "\n";
    }
  return message;
}

outcome::std_result<void>
SendmailTransport::send(const std::vector<std::string> &recipients, const std::string &subject, const std::vector<std::string> &lines)
{
  if (recipients.empty())
    {
      logger->debug("no recipients for '{}'", subject);
      return outcome::success();
    }

  try
    {
      boost::process::opstream in;
      boost::process::child child(sendmail, "-t", "-oi", boost::process::std_in < in, boost::process::std_out > boost::process::null);

      in << compose(recipients, subject, lines);
      in.flush();
      in.pipe().close();

      child.wait();
      if (child.exit_code() != 0)
        {
          logger->error("{} exited with status {}", sendmail, child.exit_code());
          return sitedeploy::DeployErrc::InternalError;
        }
    }
  catch (std::exception &e)
    {
      logger->error("failed to run {} ({})", sendmail, e.what());
      return sitedeploy::DeployErrc::InternalError;
    }

  logger->info("sent '{}' to {}", subject, boost::algorithm::join(recipients, ", "));
  return outcome::success();
}
