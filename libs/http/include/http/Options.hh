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

#ifndef NET_HTTP_OPTIONS_HH
#define NET_HTTP_OPTIONS_HH

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace sitedeploy::http
{
  class Options
  {
  public:
    Options() = default;

    // PEM encoded certificate authority trusted in addition to the system store.
    void add_ca_cert(const std::string &cert);
    void set_follow_redirects(bool follow_redirects);
    // Applies to every connect, read and write.
    void set_timeout(std::chrono::seconds timeout);
    // Limit on non-streamed response bodies.
    void set_max_response_size(std::uint64_t size);

    const std::vector<std::string> &get_ca_certs() const;
    bool get_follow_redirects() const;
    int get_max_redirects() const;
    std::chrono::seconds get_timeout() const;
    std::uint64_t get_max_response_size() const;
    std::string get_user_agent() const;

    static constexpr int max_redirects = 5;

  private:
    std::vector<std::string> ca_certs;
    bool follow_redirects = true;
    std::chrono::seconds timeout{30};
    std::uint64_t max_response_size = 16 * 1024 * 1024;
  };
} // namespace sitedeploy::http

#endif // NET_HTTP_OPTIONS_HH
