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

#include "http/HttpServer.hh"

#include <string>
#include <utility>

using namespace sitedeploy::http;
using namespace sitedeploy::http::detail;

ServerResponse
sitedeploy::http::make_text_response(boost::beast::http::status status, std::string text)
{
  ServerResponse res{status, 11};
  res.set(boost::beast::http::field::content_type, "text/plain; charset=utf-8");
  res.body() = std::move(text);
  if (!res.body().ends_with('\n'))
    {
      res.body() += "\n";
    }
  return res;
}

boost::asio::awaitable<void>
PlainSession::run()
{
  co_await serve();

  boost::beast::error_code ec;
  stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
}

boost::asio::awaitable<void>
SecureSession::run()
{
  boost::beast::error_code ec;

  boost::beast::get_lowest_layer(stream).expires_after(timeout);
  co_await stream.async_handshake(boost::asio::ssl::stream_base::server, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec)
    {
      logger->error("session handshake failed ({})", ec.message());
      co_return;
    }

  co_await serve();

  boost::beast::get_lowest_layer(stream).expires_after(timeout);
  co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  if (ec && ec != boost::asio::ssl::error::stream_truncated)
    {
      logger->debug("session shutdown failed ({})", ec.message());
    }
}

HttpServer::HttpServer(Protocol protocol, std::string address, unsigned short port, int threads)
  : protocol(protocol)
  , address(std::move(address))
  , port(port)
  , threads(threads)
{
}

HttpServer::~HttpServer()
{
  stop();
}

outcome::std_result<void>
HttpServer::set_certificate(const std::string &certificate_chain, const std::string &private_key)
{
  boost::system::error_code ec;

  ctx.set_options(boost::asio::ssl::context::default_workarounds | boost::asio::ssl::context::no_sslv2
                  | boost::asio::ssl::context::no_sslv3 | boost::asio::ssl::context::no_tlsv1
                  | boost::asio::ssl::context::no_tlsv1_1);

  ctx.use_certificate_chain(boost::asio::buffer(certificate_chain.data(), certificate_chain.size()), ec);
  if (ec)
    {
      logger->error("failed to load certificate chain ({})", ec.message());
      return HttpClientErrc::InvalidCertificate;
    }

  ctx.use_private_key(boost::asio::buffer(private_key.data(), private_key.size()), boost::asio::ssl::context::file_format::pem, ec);
  if (ec)
    {
      logger->error("failed to load private key ({})", ec.message());
      return HttpClientErrc::InvalidCertificate;
    }
  return outcome::success();
}

void
HttpServer::set_handler(RequestHandler handler)
{
  this->handler = std::move(handler);
}

void
HttpServer::set_body_limit(std::uint64_t limit)
{
  body_limit = limit;
}

unsigned short
HttpServer::get_port() const
{
  return port;
}

outcome::std_result<void>
HttpServer::run()
{
  boost::beast::error_code ec;

  auto addr = boost::asio::ip::make_address(address, ec);
  if (ec)
    {
      logger->error("invalid listen address '{}' ({})", address, ec.message());
      return HttpClientErrc::ListenFailed;
    }
  auto endpoint = boost::asio::ip::tcp::endpoint{addr, port};

  acceptor.open(endpoint.protocol(), ec);
  if (ec)
    {
      logger->error("acceptor open failed ({})", ec.message());
      return HttpClientErrc::ListenFailed;
    }

  acceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (ec)
    {
      logger->error("acceptor set_option failed ({})", ec.message());
      return HttpClientErrc::ListenFailed;
    }

  acceptor.bind(endpoint, ec);
  if (ec)
    {
      logger->error("acceptor bind failed ({})", ec.message());
      return HttpClientErrc::ListenFailed;
    }

  acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec)
    {
      logger->error("acceptor listen failed ({})", ec.message());
      return HttpClientErrc::ListenFailed;
    }

  port = acceptor.local_endpoint().port();
  logger->info("listening on {}:{} ({})", address, port, protocol == Protocol::Secure ? "https" : "http");

  boost::asio::co_spawn(ioc, do_listen(), boost::asio::detached);

  workers.reserve(threads);
  for (auto i = 0; i < threads; i++)
    {
      workers.emplace_back([this] { ioc.run(); });
    }
  return outcome::success();
}

boost::asio::awaitable<void>
HttpServer::do_listen()
{
  for (;;)
    {
      boost::beast::error_code ec;
      auto socket = co_await acceptor.async_accept(boost::asio::make_strand(ioc),
                                                   boost::asio::redirect_error(boost::asio::use_awaitable, ec));
      if (ec == boost::asio::error::operation_aborted)
        {
          co_return;
        }
      if (ec)
        {
          logger->error("acceptor accept failed ({})", ec.message());
          continue;
        }

      auto executor = socket.get_executor();
      if (protocol == Protocol::Secure)
        {
          auto session = std::make_shared<SecureSession>(std::move(socket), ctx, handler, body_limit);
          boost::asio::co_spawn(
            executor,
            [session]() -> boost::asio::awaitable<void> { co_await session->run(); },
            boost::asio::detached);
        }
      else
        {
          auto session = std::make_shared<PlainSession>(std::move(socket), handler, body_limit);
          boost::asio::co_spawn(
            executor,
            [session]() -> boost::asio::awaitable<void> { co_await session->run(); },
            boost::asio::detached);
        }
    }
}

void
HttpServer::stop()
{
  if (!workers.empty())
    {
      ioc.stop();
      for (auto &w: workers)
        {
          w.join();
        }
      workers.clear();

      boost::system::error_code ec;
      acceptor.close(ec);
    }
}
