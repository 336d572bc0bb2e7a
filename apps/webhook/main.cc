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

#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include "http/HttpClient.hh"
#include "http/HttpServer.hh"
#include "sitedeploy/Configuration.hh"
#include "utils/IOContext.hh"
#include "utils/Logging.hh"

#include "MailTransport.hh"
#include "WebhookService.hh"

namespace po = boost::program_options;

namespace
{
  constexpr int worker_threads = 4;
  constexpr std::chrono::seconds status_timeout{10};

  std::optional<std::string> read_file(const std::string &filename)
  {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open())
      {
        return {};
      }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
  }
} // namespace

int
main(int argc, char *argv[])
{
  std::string config_file;
  std::string address;
  unsigned short port = 0;
  std::string certificate_file;
  std::string private_key_file;
  std::string log_level;
  std::string log_file;

  po::options_description desc("Usage: sitedeploy-webhook [options]");
  desc.add_options()("help,h", "show this help")                                                                 //
    ("config,c", po::value<std::string>(&config_file)->default_value("/etc/sitedeploy/config.json"), "configuration file") //
    ("address,a", po::value<std::string>(&address)->default_value("127.0.0.1"), "listen address")                         //
    ("port,p", po::value<unsigned short>(&port)->default_value(8080), "listen port")                                      //
    ("tls-certificate", po::value<std::string>(&certificate_file), "PEM certificate chain, enables HTTPS")                //
    ("tls-private-key", po::value<std::string>(&private_key_file), "PEM private key of the certificate")                  //
    ("log-level", po::value<std::string>(&log_level)->default_value("info"), "trace, debug, info, warn, error")           //
    ("log-file", po::value<std::string>(&log_file), "also log to this file");

  po::variables_map vm;
  try
    {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    }
  catch (po::error &e)
    {
      std::cerr << e.what() << "\n" << desc << "\n";
      return 2;
    }

  if (vm.count("help") > 0)
    {
      std::cout << desc << "\n";
      return 0;
    }

  std::optional<std::filesystem::path> log_path;
  if (!log_file.empty())
    {
      log_path = log_file;
    }
  sitedeploy::utils::Logging::setup("sitedeploy", spdlog::level::from_str(log_level), log_path);

  if (certificate_file.empty() != private_key_file.empty())
    {
      spdlog::error("--tls-certificate and --tls-private-key must be used together");
      return 2;
    }

  auto config = sitedeploy::Configuration::load_from_file(config_file);
  if (!config)
    {
      spdlog::error("cannot load {} ({})", config_file, config.error().message());
      return 1;
    }
  auto shared_config = std::make_shared<const sitedeploy::Configuration>(std::move(config.value()));

  auto http = std::make_shared<sitedeploy::http::HttpClient>();
  auto status_http = std::make_shared<sitedeploy::http::HttpClient>();
  status_http->options().set_timeout(status_timeout);
  auto transport = std::make_shared<SendmailTransport>(shared_config->mail.sendmail, shared_config->mail.from);

  sitedeploy::utils::IOContext workers{worker_threads};
  auto service = std::make_shared<WebhookService>(shared_config, http, status_http, transport, workers);
  if (!service->init())
    {
      return 1;
    }

  auto protocol = certificate_file.empty() ? sitedeploy::http::Protocol::Plain : sitedeploy::http::Protocol::Secure;
  sitedeploy::http::HttpServer server(protocol, address, port);
  if (protocol == sitedeploy::http::Protocol::Secure)
    {
      auto certificate = read_file(certificate_file);
      auto private_key = read_file(private_key_file);
      if (!certificate || !private_key)
        {
          spdlog::error("cannot read TLS certificate or private key");
          return 1;
        }
      if (!server.set_certificate(*certificate, *private_key))
        {
          return 1;
        }
    }

  server.set_handler([service](sitedeploy::http::ServerRequest request) { return service->handle(std::move(request)); });
  if (!server.run())
    {
      return 1;
    }
  spdlog::info("listening on {}:{}", address, server.get_port());

  boost::asio::io_context ioc;
  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int signal) {
    if (!ec)
      {
        spdlog::info("received signal {}, shutting down", signal);
        service->shutdown();
      }
  });
  ioc.run();

  server.stop();
  workers.drain();
  workers.wait();
  spdlog::info("stopped");
  return 0;
}
