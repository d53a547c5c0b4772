#include "server/HttpServer.hpp"
#include "http/SocketBodyBuf.hpp"
#include <cctype>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace asio = boost::asio;
using asio::ip::tcp;

namespace chunkstash {

namespace {

constexpr std::size_t kMaxRequestHead = 64 * 1024;

void trim(std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && (s[a] == ' ' || s[a] == '\t')) ++a;
    while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r' || s[b - 1] == '\n')) --b;
    s = s.substr(a, b - a);
}

void tolower_inplace(std::string& s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

void write_response(tcp::socket& socket, const http::Response& res) {
    std::ostringstream response;
    response << "HTTP/1.1 " << res.status << " " << http::status_text(res.status) << "\r\n";
    response << "Content-Length: " << res.body.size() << "\r\n";
    response << "Content-Type: " << res.contentType << "\r\n";
    response << "Connection: close\r\n\r\n";
    response << res.body;

    boost::system::error_code ec;
    asio::write(socket, asio::buffer(response.str()), ec);
    if (ec) {
        std::cerr << "Failed writing response: " << ec.message() << std::endl;
    }
}

} // namespace

HttpServer::HttpServer(const config::ServerConfig& config) : acceptor_(io_context_)
{
    config::BindAddress bind = config::parseBindAddress(config.bindAddress);
    tcp::endpoint endpoint(tcp::v4(), bind.port);
    if (!bind.host.empty()) {
        endpoint = tcp::endpoint(asio::ip::make_address(bind.host), bind.port);
    }

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
}

void HttpServer::add_endpoint(const endpoint& ep)
{
    handlers_.insert_or_assign(ep.get_path(), ep);
}

uint16_t HttpServer::port() const
{
    return acceptor_.local_endpoint().port();
}

http::Response HttpServer::dispatch(http::Request& request) const
{
    auto it = handlers_.find(request.path);
    if (it == handlers_.end()) {
        return http::Response::notFound();
    }
    if (it->second.get_rest_type() != request.method) {
        return http::Response::methodNotAllowed();
    }

    try {
        return it->second.get_handler()(request);
    }
    catch (const std::exception& e) {
        std::cerr << "Unhandled error on " << request.path << ": " << e.what() << std::endl;
        return http::Response::error(e.what());
    }
}

void HttpServer::run()
{
    std::cout << "Server listening on " << acceptor_.local_endpoint() << std::endl;

    while (true)
    {
        tcp::socket socket(io_context_);
        boost::system::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec) {
            std::cerr << "Accept failed: " << ec.message() << std::endl;
            continue;
        }

        std::thread([this, s = std::move(socket)]() mutable {
            handle_connection(std::move(s));
        }).detach();
    }
}

void HttpServer::serve_one()
{
    tcp::socket socket(io_context_);
    acceptor_.accept(socket);
    handle_connection(std::move(socket));
}

void HttpServer::handle_connection(tcp::socket socket) const
{
    asio::streambuf buf(kMaxRequestHead);
    boost::system::error_code ec;

    asio::read_until(socket, buf, "\r\n\r\n", ec);
    if (ec) {
        if (ec == asio::error::not_found) {
            write_response(socket, {431, "text/plain", "Request Header Fields Too Large"});
        } else if (ec != asio::error::eof) {
            std::cerr << "Failed reading request: " << ec.message() << std::endl;
        }
        return;
    }

    std::istream request_stream(&buf);

    std::string method, path, version;
    request_stream >> method >> path >> version;

    std::string dummy;
    std::getline(request_stream, dummy);

    http::Request req;
    try {
        req.method = http::from_string(method);
    } catch (const std::invalid_argument& e) {
        write_response(socket, http::Response::badRequest(e.what()));
        return;
    }

    req.path = path;
    auto qm = path.find('?');
    if (qm != std::string::npos) req.path = path.substr(0, qm);

    bool has_content_length = false;
    std::string header_line;
    while (std::getline(request_stream, header_line) && header_line != "\r")
    {
        if (!header_line.empty() && header_line.back() == '\r') header_line.pop_back();
        if (header_line.empty()) break;

        auto colon = header_line.find(':');
        if (colon == std::string::npos) {
            write_response(socket, http::Response::badRequest("Malformed header line"));
            return;
        }

        std::string name = header_line.substr(0, colon);
        std::string value = header_line.substr(colon + 1);
        trim(name); trim(value);
        tolower_inplace(name);

        if (name == "content-length") {
            try {
                size_t parsed = 0;
                req.contentLength = static_cast<size_t>(std::stoull(value, &parsed));
                if (parsed != value.size()) throw std::invalid_argument(value);
                has_content_length = true;
            } catch (const std::exception&) {
                write_response(socket, http::Response::badRequest("Invalid Content-Length"));
                return;
            }
        }
        req.headers[name] = value;
    }

    bool expects_body = req.method == http::HttpRequest::POST ||
                        req.method == http::HttpRequest::PUT ||
                        req.method == http::HttpRequest::PATCH;
    if (expects_body && !has_content_length) {
        write_response(socket, http::Response::lengthRequired());
        return;
    }

    http::SocketBodyBuf body_buf(socket, buf, req.contentLength);
    std::istream body(&body_buf);
    req.body = &body;

    http::Response res = dispatch(req);
    std::cout << http::to_string(req.method) << " " << req.path << " -> " << res.status << std::endl;
    if (res.status >= 500) {
        std::cerr << "Request " << http::to_string(req.method) << " " << req.path << " failed: " << res.body << std::endl;
    }

    // Closing with unread input resets the connection before the client
    // sees the response. The rest is bounded by Content-Length.
    body.clear();
    body.ignore(std::numeric_limits<std::streamsize>::max());
    if (body.bad()) {
        std::cerr << "Failed draining request body of " << req.path << std::endl;
        return;
    }

    write_response(socket, res);
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

} // namespace chunkstash
