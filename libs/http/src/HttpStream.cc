// Copyright (C) 2022, 2023 Rob Caelers <rob.caelers@gmail.com>
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

#include "http/HttpStream.hh"

#include <exception>
#include <limits>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>

#include "http/HttpClientErrors.hh"
#include "http/Options.hh"

using namespace sitedeploy::http;

namespace
{
  void normalize_port(boost::urls::url &url)
  {
    if (url.port().empty())
      {
        url.set_port(url.scheme() == "https" ? "443" : "80");
      }
  }

  bool same_origin(const boost::urls::url &a, const boost::urls::url &b)
  {
    return a.scheme() == b.scheme() && a.encoded_host() == b.encoded_host() && a.port() == b.port();
  }
} // namespace

HttpStream::HttpStream(Options options_)
  : options(std::move(options_))
{
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(boost::asio::ssl::verify_peer);
}

boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::execute(Request req, ChunkCallback cb)
{
  request = std::move(req);

  auto url_rc = parse_url(request.url);
  if (!url_rc)
    {
      co_return url_rc.as_failure();
    }
  requested_url = url_rc.value();

  outcome::std_result<HttpStream::response_t> response_rc = outcome::success();
  while (true)
    {
      if (connect_required())
        {
          auto rc = co_await connect();
          if (!rc)
            {
              co_return rc.as_failure();
            }

          if (is_tls_connection())
            {
              rc = co_await encrypt_connection();
              if (!rc)
                {
                  co_return rc.as_failure();
                }
            }
        }

      response_rc = co_await send_receive_request(cb);
      if (!response_rc)
        {
          co_return response_rc.as_failure();
        }

      auto redirect_rc = handle_redirect(response_rc.value());
      if (!redirect_rc)
        {
          co_return redirect_rc.as_failure();
        }

      if (!redirect_rc.value())
        {
          break;
        }
      logger->debug("redirecting to {}", std::string(requested_url.buffer()));
    }

  co_await shutdown();
  co_return response_rc;
}

boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::send_receive_request(const ChunkCallback &cb)
{
  if (is_tls_connection())
    {
      co_return co_await send_receive_request(secure_stream, cb);
    }
  co_return co_await send_receive_request(plain_stream, cb);
}

template<typename StreamType>
boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::send_receive_request(StreamType stream, const ChunkCallback &cb)
{
  auto req = create_request();

  auto request_rc = co_await send_request(stream, std::move(req));
  if (!request_rc)
    {
      co_return request_rc.as_failure();
    }

  if (cb)
    {
      co_return co_await receive_response_body_chunked(stream, cb);
    }
  co_return co_await receive_response_body(stream);
}

outcome::std_result<boost::urls::url>
HttpStream::parse_url(const std::string &u)
{
  auto url_rc = boost::urls::parse_uri(u);

  if (!url_rc)
    {
      logger->error("malformed URL '{}' ({})", u, url_rc.error().message());
      return HttpClientErrc::MalformedURL;
    }
  boost::urls::url url = url_rc.value();

  if (url.scheme() != "https" && url.scheme() != "http")
    {
      logger->error("unsupported URL scheme '{}'", u);
      return HttpClientErrc::MalformedURL;
    }

  normalize_port(url);
  return url;
}

bool
HttpStream::connect_required()
{
  return !connected_url || !same_origin(requested_url, *connected_url);
}

boost::asio::awaitable<outcome::std_result<void>>
HttpStream::connect()
{
  auto url = requested_url;
  connected_url.reset();
  secure_stream.reset();

  auto executor = co_await boost::asio::this_coro::executor;
  plain_stream = std::make_shared<boost::beast::tcp_stream>(executor);

  boost::system::error_code ec;
  boost::asio::ip::tcp::resolver resolver(executor);
  auto results = co_await resolver.async_resolve(std::string(url.host()),
                                                 std::string(url.port()),
                                                 boost::asio::redirect_error(boost::asio::use_awaitable, ec));

  if (ec)
    {
      logger->error("failed to resolve hostname '{}' ({})", std::string(url.host()), ec.message());
      co_return HttpClientErrc::NameResolutionFailed;
    }

  plain_stream->expires_after(options.get_timeout());
  co_await plain_stream->async_connect(results, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to connect to '{}:{}' ({})", std::string(url.host()), std::string(url.port()), ec.message());
      co_return HttpClientErrc::ConnectionRefused;
    }
  connected_url = url;
  co_return outcome::success();
}

boost::asio::awaitable<outcome::std_result<void>>
HttpStream::encrypt_connection()
{
  auto rc = init_certificates();
  if (!rc)
    {
      co_return rc.as_failure();
    }

  std::string host(requested_url.host());
  secure_stream = std::make_shared<secure_stream_t>(std::move(*plain_stream), ctx);
  secure_stream->set_verify_callback(boost::asio::ssl::host_name_verification(host));

  if (!SSL_set_tlsext_host_name(secure_stream->native_handle(), host.c_str()))
    {
      logger->error("failed to set TLS hostname");
      co_return HttpClientErrc::InternalError;
    }

  boost::system::error_code ec;

  boost::beast::get_lowest_layer(*secure_stream).expires_after(options.get_timeout());
  co_await secure_stream->async_handshake(boost::asio::ssl::stream_base::client,
                                          boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to perform TLS handshake with '{}' ({})", host, ec.message());
      co_return HttpClientErrc::CommunicationError;
    }

  co_return outcome::success();
}

HttpStream::request_t
HttpStream::create_request()
{
  std::string target(requested_url.encoded_resource());
  if (target.empty())
    {
      target = "/";
    }

  std::string host(requested_url.encoded_host());
  if (requested_url.port() != (requested_url.scheme() == "https" ? "443" : "80"))
    {
      host += ":" + std::string(requested_url.port());
    }

  constexpr auto http_version = 11;
  request_t req;
  req.method(request.method);
  req.target(target);
  req.version(http_version);
  req.set(boost::beast::http::field::host, host);
  req.set(boost::beast::http::field::user_agent, options.get_user_agent());
  for (const auto &[name, value]: request.headers)
    {
      req.set(name, value);
    }
  if (!request.body.empty() || request.method == boost::beast::http::verb::post)
    {
      req.body() = request.body;
    }
  req.prepare_payload();

  logger->debug("req {} {}", req.method_string(), target);
  for (auto const &field: req)
    {
      if (field.name() == boost::beast::http::field::authorization)
        {
          logger->debug("req {}: (redacted)", field.name_string());
          continue;
        }
      logger->debug("req {}: {}", field.name_string(), field.value());
    }

  return req;
}

template<typename StreamType>
boost::asio::awaitable<outcome::std_result<void>>
HttpStream::send_request(StreamType stream, request_t req)
{
  boost::system::error_code ec;

  boost::beast::get_lowest_layer(*stream).expires_after(options.get_timeout());
  co_await boost::beast::http::async_write(*stream, req, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to send HTTP request to '{}' ({})", std::string(connected_url->host()), ec.message());
      co_return HttpClientErrc::CommunicationError;
    }

  co_return outcome::success();
}

template<typename StreamType>
boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::receive_response_body(StreamType stream)
{
  boost::system::error_code ec;
  boost::beast::flat_buffer buffer;
  boost::beast::http::response_parser<boost::beast::http::string_body> parser;
  parser.body_limit(options.get_max_response_size());

  boost::beast::get_lowest_layer(*stream).expires_after(options.get_timeout());
  co_await boost::beast::http::async_read(*stream, buffer, parser, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to read HTTP response from {} ({})", std::string(connected_url->host()), ec.message());
      co_return HttpClientErrc::CommunicationError;
    }

  logger->debug("resp HTTP/{} {}", parser.get().version(), parser.get().result_int());
  co_return parser.release();
}

template<typename StreamType>
boost::asio::awaitable<outcome::std_result<HttpStream::response_t>>
HttpStream::receive_response_body_chunked(StreamType stream, const ChunkCallback &cb)
{
  boost::system::error_code ec;
  boost::beast::flat_buffer buffer;
  boost::beast::http::response_parser<boost::beast::http::empty_body> header_parser;

  boost::beast::get_lowest_layer(*stream).expires_after(options.get_timeout());
  co_await boost::beast::http::async_read_header(*stream,
                                                 buffer,
                                                 header_parser,
                                                 boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("failed to read HTTP header from {} ({})", std::string(connected_url->host()), ec.message());
      co_return HttpClientErrc::CommunicationError;
    }

  logger->debug("resp HTTP/{} {}", header_parser.get().version(), header_parser.get().result_int());

  if (boost::beast::http::to_status_class(header_parser.get().result()) != boost::beast::http::status_class::successful)
    {
      boost::beast::http::response_parser<boost::beast::http::string_body> string_parser{std::move(header_parser)};
      string_parser.body_limit(options.get_max_response_size());
      co_await boost::beast::http::async_read(*stream,
                                              buffer,
                                              string_parser,
                                              boost::asio::redirect_error(boost::asio::use_awaitable, ec));
      if (ec)
        {
          logger->error("failed to read HTTP response from {} ({})", std::string(connected_url->host()), ec.message());
          co_return HttpClientErrc::CommunicationError;
        }
      co_return string_parser.release();
    }

  boost::beast::http::response_parser<boost::beast::http::buffer_body> parser{std::move(header_parser)};
  parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

  std::vector<char> chunk(chunk_size);
  while (!parser.is_done())
    {
      parser.get().body().data = chunk.data();
      parser.get().body().size = chunk.size();

      boost::beast::get_lowest_layer(*stream).expires_after(options.get_timeout());
      co_await boost::beast::http::async_read(*stream,
                                              buffer,
                                              parser,
                                              boost::asio::redirect_error(boost::asio::use_awaitable, ec));
      if (ec == boost::beast::http::error::need_buffer)
        {
          ec = {};
        }
      if (ec)
        {
          logger->error("failed to read HTTP body from {} ({})", std::string(connected_url->host()), ec.message());
          co_return HttpClientErrc::CommunicationError;
        }

      auto received = chunk.size() - parser.get().body().size;
      if (received > 0)
        {
          auto rc = cb(std::string_view(chunk.data(), received));
          if (!rc)
            {
              co_return rc.as_failure();
            }
        }
    }

  response_t response{std::move(parser.get().base())};
  co_return response;
}

outcome::std_result<bool>
HttpStream::handle_redirect(const response_t &response)
{
  if (!is_redirect(response.result()) || !options.get_follow_redirects())
    {
      return false;
    }

  if (!response.keep_alive())
    {
      connected_url.reset();
    }

  redirect_count++;
  if (redirect_count > options.get_max_redirects())
    {
      logger->error("too many redirects");
      return HttpClientErrc::TooManyRedirects;
    }

  std::string location{response.base()[boost::beast::http::field::location]};
  if (location.empty())
    {
      logger->error("no Location header in redirect response from {}", std::string(connected_url->host()));
      return HttpClientErrc::InvalidRedirect;
    }

  auto ref = boost::urls::parse_uri_reference(location);
  if (!ref)
    {
      logger->error("malformed redirect URL '{}'", location);
      return HttpClientErrc::InvalidRedirect;
    }

  boost::urls::url target;
  auto resolved = boost::urls::resolve(requested_url, ref.value(), target);
  if (!resolved || (target.scheme() != "https" && target.scheme() != "http"))
    {
      logger->error("invalid redirect URL '{}'", location);
      return HttpClientErrc::InvalidRedirect;
    }
  normalize_port(target);

  if (!same_origin(target, requested_url) && request.headers.erase("Authorization") > 0)
    {
      logger->debug("dropping credentials on redirect to {}", std::string(target.encoded_host()));
    }

  auto status = response.result();
  if (status == boost::beast::http::status::see_other
      || (request.method == boost::beast::http::verb::post
          && (status == boost::beast::http::status::moved_permanently || status == boost::beast::http::status::found)))
    {
      request.method = boost::beast::http::verb::get;
      request.body.clear();
    }

  requested_url = std::move(target);
  return true;
}

template<>
boost::asio::awaitable<void>
HttpStream::shutdown_impl<std::shared_ptr<HttpStream::secure_stream_t>>(std::shared_ptr<secure_stream_t> stream)
{
  boost::system::error_code ec;
  boost::beast::get_lowest_layer(*stream).expires_after(options.get_timeout());
  co_await stream->async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec && ec != boost::asio::error::eof && ec != boost::asio::ssl::error::stream_truncated)
    {
      logger->debug("TLS shutdown failed ({})", ec.message());
    }
}

template<>
boost::asio::awaitable<void>
HttpStream::shutdown_impl<std::shared_ptr<HttpStream::plain_stream_t>>(std::shared_ptr<plain_stream_t> stream)
{
  boost::system::error_code ec;
  stream->socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  stream->socket().close(ec);
  co_return;
}

boost::asio::awaitable<void>
HttpStream::shutdown()
{
  if (is_tls_connection())
    {
      co_return co_await shutdown_impl(secure_stream);
    }
  co_return co_await shutdown_impl(plain_stream);
}

outcome::std_result<void>
HttpStream::init_certificates()
{
  for (const auto &cert: options.get_ca_certs())
    {
      boost::system::error_code ec;
      ctx.add_certificate_authority(boost::asio::buffer(cert.data(), cert.size()), ec);
      if (ec)
        {
          logger->error("add_certificate_authority failed ({})", ec.message());
          return outcome::failure(HttpClientErrc::InvalidCertificate);
        }
    }
  return outcome::success();
}

bool
HttpStream::is_redirect(auto code)
{
  return code == boost::beast::http::status::moved_permanently || code == boost::beast::http::status::found
         || code == boost::beast::http::status::see_other || code == boost::beast::http::status::temporary_redirect
         || code == boost::beast::http::status::permanent_redirect;
}

bool
HttpStream::is_tls_connection()
{
  return connected_url && connected_url->scheme() == "https";
}
