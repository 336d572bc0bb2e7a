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

#ifndef NET_HTTP_SERVER_HH
#define NET_HTTP_SERVER_HH

#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <boost/outcome/std_result.hpp>

#include <spdlog/spdlog.h>

#include "utils/Logging.hh"
#include "http/HttpClientErrors.hh"

namespace outcome = boost::outcome_v2;

namespace sitedeploy::http
{
  using ServerRequest = boost::beast::http::request<boost::beast::http::string_body>;
  using ServerResponse = boost::beast::http::response<boost::beast::http::string_body>;
  using RequestHandler = std::function<boost::asio::awaitable<ServerResponse>(ServerRequest request)>;

  ServerResponse make_text_response(boost::beast::http::status status, std::string text);

  namespace detail
  {
    template<typename StreamType>
    class Session
    {
    public:
      Session(StreamType &&stream, RequestHandler handler, std::uint64_t body_limit)
        : stream(std::move(stream))
        , handler(std::move(handler))
        , body_limit(body_limit)
      {
      }

      ~Session() = default;
      Session(const Session &) = delete;
      Session &operator=(const Session &) = delete;
      Session(Session &&) = delete;
      Session &operator=(Session &&) = delete;

    private:
      boost::asio::awaitable<bool> send(ServerResponse &&res, bool keep_alive, boost::beast::error_code &ec)
      {
        res.version(version);
        res.set(boost::beast::http::field::server, "sitedeploy");
        res.keep_alive(keep_alive);
        res.prepare_payload();

        auto eof = res.need_eof();
        boost::beast::http::serializer<false, boost::beast::http::string_body> sr{res};
        co_await boost::beast::http::async_write(stream, sr, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        co_return eof;
      }

      boost::asio::awaitable<ServerResponse> dispatch(ServerRequest req)
      {
        try
          {
            co_return co_await handler(std::move(req));
          }
        catch (std::exception &e)
          {
            logger->error("request handler failed ({})", e.what());
          }
        co_return make_text_response(boost::beast::http::status::internal_server_error, "internal error");
      }

    protected:
      boost::asio::awaitable<void> serve()
      {
        boost::beast::error_code ec;
        boost::beast::flat_buffer buffer;

        for (;;)
          {
            boost::beast::http::request_parser<boost::beast::http::string_body> parser;
            parser.body_limit(body_limit);

            boost::beast::get_lowest_layer(stream).expires_after(timeout);
            co_await boost::beast::http::async_read(stream, buffer, parser, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec == boost::beast::http::error::end_of_stream)
              {
                break;
              }
            if (ec == boost::beast::http::error::body_limit)
              {
                logger->warn("request body exceeds {} bytes", body_limit);
                version = parser.get().version();
                co_await send(make_text_response(boost::beast::http::status::payload_too_large, "payload too large"), false, ec);
                break;
              }
            if (ec)
              {
                logger->debug("session read failed ({})", ec.message());
                co_return;
              }

            auto req = parser.release();
            version = req.version();
            bool keep_alive = req.keep_alive();
            logger->debug("{} {}", std::string(req.method_string()), std::string(req.target()));

            auto res = co_await dispatch(std::move(req));

            boost::beast::get_lowest_layer(stream).expires_after(timeout);
            bool close = co_await send(std::move(res), keep_alive, ec);
            if (ec)
              {
                logger->debug("session write failed ({})", ec.message());
                co_return;
              }

            if (close)
              {
                break;
              }
          }
      }

    protected:
      static constexpr std::chrono::seconds timeout{30};
      StreamType stream;

    private:
      RequestHandler handler;
      std::uint64_t body_limit;
      unsigned version{11};
      std::shared_ptr<spdlog::logger> logger{sitedeploy::utils::Logging::create("sitedeploy:server:session")};
    };

    class PlainSession : public Session<boost::beast::tcp_stream>
    {
    public:
      PlainSession(boost::asio::ip::tcp::socket socket, RequestHandler handler, std::uint64_t body_limit)
        : Session<boost::beast::tcp_stream>(boost::beast::tcp_stream(std::move(socket)), std::move(handler), body_limit)
      {
      }

      boost::asio::awaitable<void> run();
    };

    class SecureSession : public Session<boost::beast::ssl_stream<boost::beast::tcp_stream>>
    {
    public:
      SecureSession(boost::asio::ip::tcp::socket socket,
                    boost::asio::ssl::context &ctx,
                    RequestHandler handler,
                    std::uint64_t body_limit)
        : Session<boost::beast::ssl_stream<boost::beast::tcp_stream>>({std::move(socket), ctx}, std::move(handler), body_limit)
      {
      }

      boost::asio::awaitable<void> run();

    private:
      std::shared_ptr<spdlog::logger> logger{sitedeploy::utils::Logging::create("sitedeploy:server:tls")};
    };
  } // namespace detail

  enum class Protocol
  {
    Plain,
    Secure
  };

  class HttpServer
  {
  public:
    HttpServer(Protocol protocol, std::string address, unsigned short port, int threads = 4);
    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;
    HttpServer(HttpServer &&) = delete;
    HttpServer &operator=(HttpServer &&) = delete;

    // PEM encoded certificate chain and private key. Required for Protocol::Secure.
    outcome::std_result<void> set_certificate(const std::string &certificate_chain, const std::string &private_key);
    void set_handler(RequestHandler handler);
    void set_body_limit(std::uint64_t limit);

    outcome::std_result<void> run();
    void stop();

    unsigned short get_port() const;

    static constexpr std::uint64_t default_body_limit = 25 * 1024 * 1024;

  private:
    boost::asio::awaitable<void> do_listen();

  private:
    Protocol protocol;
    std::string address;
    unsigned short port;
    int threads;
    std::uint64_t body_limit{default_body_limit};
    RequestHandler handler;
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::acceptor acceptor{ioc};
    boost::asio::ssl::context ctx{boost::asio::ssl::context::tlsv12_server};
    std::vector<std::thread> workers;
    std::shared_ptr<spdlog::logger> logger{sitedeploy::utils::Logging::create("sitedeploy:server")};
  };
} // namespace sitedeploy::http

#endif // NET_HTTP_SERVER_HH
