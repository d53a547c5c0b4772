#pragma once
#include <boost/asio.hpp>
#include <unordered_map>
#include <string>
#include "config/Config.hpp"
#include "const/rest_enums.hpp"
#include "http/Request.hpp"
#include "server/endpoint.hpp"

namespace chunkstash {

/*
  Minimal HTTP/1.1 server.

  Connections are accepted on the thread calling run() and each one is
  served on its own thread. Every response closes the connection.
  Endpoints must be registered before run(); the table is read without
  locking afterwards.
*/
class HttpServer
{
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::unordered_map<std::string, endpoint> handlers_;

public:
    explicit HttpServer(const config::ServerConfig& config);

    void add_endpoint(const endpoint& ep);

    // Accept loop, never returns
    void run();

    // Accepts one connection and serves it on the calling thread
    void serve_one();

    uint16_t port() const;

    // Routes one parsed request; exposed so handlers can be exercised without a socket
    http::Response dispatch(http::Request& request) const;

private:
    void handle_connection(boost::asio::ip::tcp::socket socket) const;
};

} // namespace chunkstash
