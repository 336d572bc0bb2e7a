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

#include "http/Options.hh"

using namespace sitedeploy::http;

void
Options::add_ca_cert(const std::string &cert)
{
  ca_certs.push_back(cert);
}

const std::vector<std::string> &
Options::get_ca_certs() const
{
  return ca_certs;
}

void
Options::set_follow_redirects(bool follow_redirects)
{
  this->follow_redirects = follow_redirects;
}

bool
Options::get_follow_redirects() const
{
  return follow_redirects;
}

int
Options::get_max_redirects() const
{
  return max_redirects;
}

void
Options::set_timeout(std::chrono::seconds timeout)
{
  this->timeout = timeout;
}

std::chrono::seconds
Options::get_timeout() const
{
  return timeout;
}

void
Options::set_max_response_size(std::uint64_t size)
{
  max_response_size = size;
}

std::uint64_t
Options::get_max_response_size() const
{
  return max_response_size;
}

std::string
Options::get_user_agent() const
{
  return "sitedeploy/1.0";
}
