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

#ifndef MAIL_TRANSPORT_HH
#define MAIL_TRANSPORT_HH

#include <memory>
#include <string>
#include <vector>

#include <boost/outcome/std_result.hpp>

#include "utils/Logging.hh"

namespace outcome = boost::outcome_v2;

class MailTransport
{
public:
  virtual ~MailTransport() = default;

  virtual outcome::std_result<void> send(const std::vector<std::string> &recipients,
                                         const std::string &subject,
                                         const std::vector<std::string> &lines) = 0;
};

// Hands an RFC 5322 message to `sendmail -t -oi`.
class SendmailTransport : public MailTransport
{
public:
  SendmailTransport(std::string sendmail, std::string from);

  outcome::std_result<void> send(const std::vector<std::string> &recipients,
                                 const std::string &subject,
                                 const std::vector<std::string> &lines) override;

  std::string compose(const std::vector<std::string> &recipients, const std::string &subject, const std::vector<std::string> &lines) const;

private:
  std::string sendmail;
  std::string from;
  std::shared_ptr<spdlog::logger> logger{sitedeploy::utils::Logging::create("sitedeploy:mail")};
};

#endif // MAIL_TRANSPORT_HH
