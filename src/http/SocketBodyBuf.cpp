#include "http/SocketBodyBuf.hpp"
#include <algorithm>

namespace chunkstash {
namespace http {

SocketBodyBuf::SocketBodyBuf(boost::asio::ip::tcp::socket& socket,
                             boost::asio::streambuf& pending,
                             std::size_t contentLength)
    : socket_(socket), pending_(pending), remaining_(contentLength) {
    setg(buffer_.data(), buffer_.data(), buffer_.data());
}

SocketBodyBuf::int_type SocketBodyBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    if (remaining_ == 0) {
        return traits_type::eof();
    }

    std::size_t want = std::min(remaining_, buffer_.size());
    std::size_t got = 0;
    if (pending_.size() > 0) {
        want = std::min(want, pending_.size());
        got = static_cast<std::size_t>(pending_.sgetn(buffer_.data(), static_cast<std::streamsize>(want)));
    } else {
        got = socket_.read_some(boost::asio::buffer(buffer_.data(), want));
    }

    if (got == 0) {
        return traits_type::eof();
    }
    remaining_ -= got;
    setg(buffer_.data(), buffer_.data(), buffer_.data() + got);
    return traits_type::to_int_type(*gptr());
}

} // namespace http
} // namespace chunkstash
