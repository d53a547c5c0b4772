#pragma once

#include <array>
#include <cstddef>
#include <streambuf>
#include <boost/asio.hpp>

namespace chunkstash {
namespace http {

/**
 * Request body as a std::streambuf. Drains the bytes already pulled into
 * the header buffer first, then reads from the socket until contentLength
 * bytes have been delivered.
 *
 * Socket errors are thrown as boost::system::system_error from underflow().
 */
class SocketBodyBuf : public std::streambuf {
public:
    SocketBodyBuf(boost::asio::ip::tcp::socket& socket,
                  boost::asio::streambuf& pending,
                  std::size_t contentLength);

    std::size_t remaining() const { return remaining_; }

protected:
    int_type underflow() override;

private:
    boost::asio::ip::tcp::socket& socket_;
    boost::asio::streambuf& pending_;
    std::size_t remaining_;
    std::array<char, 64 * 1024> buffer_;
};

} // namespace http
} // namespace chunkstash
