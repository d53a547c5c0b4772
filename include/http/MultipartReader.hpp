#pragma once

#include <array>
#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <streambuf>
#include <string>

namespace chunkstash {
namespace http {

class MultipartError : public std::runtime_error {
public:
    explicit MultipartError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Headers of a single part of a multipart/form-data body
 */
struct PartHeaders {
    std::string name;           // form field name, empty unless disposition is form-data
    std::string filename;       // original filename (empty if not a file)
    std::string content_type;   // MIME type of the content

    bool isFile() const { return !filename.empty(); }
};

/**
 * Streaming reader for multipart/form-data bodies.
 *
 * Parts are visited in the order they appear on the wire. Only a small
 * window of the body is held in memory, so a part body can be copied
 * straight to its destination without buffering it.
 */
class MultipartReader {
public:
    MultipartReader(std::istream& body, const std::string& boundary);

    /**
     * Advance to the next part, discarding what is left of the current one.
     * @return Headers of the next part, or std::nullopt after the closing boundary
     * @throws MultipartError on framing errors or premature end of the body
     */
    std::optional<PartHeaders> nextPart();

    /**
     * Read up to n bytes of the current part body.
     * @return Number of bytes copied, 0 once the part is exhausted
     */
    std::size_t read(char* out, std::size_t n);

    /**
     * Read the rest of the current part body into a string.
     * @param limit Maximum accepted size; MultipartError if the part is larger
     */
    std::string readAll(std::size_t limit);

    /**
     * Extract boundary from Content-Type header value
     * @param content_type Full Content-Type header value
     * @return Boundary string or empty if not found
     */
    static std::string extractBoundary(const std::string& content_type);

    // Media type of a Content-Type value, lower-cased and without parameters
    static std::string mediaType(const std::string& content_type);

    static void trim(std::string& s);
    static void toLower(std::string& s);

private:
    enum class State { Preamble, Headers, Body, Done };

    std::istream& body_;
    std::string delimiter_;     // CRLF "--" boundary
    std::string buffer_;
    std::size_t pos_ = 0;
    bool eof_ = false;
    State state_ = State::Preamble;

    bool fill();
    bool ensure(std::size_t n);
    std::size_t readBody(char* out, std::size_t n);
    void afterDelimiter();
    PartHeaders readHeaders();

    static void parseContentDisposition(const std::string& value, std::string& name, std::string& filename);
};

/**
 * Exposes the current part of a MultipartReader as a std::streambuf.
 * Shares ownership of the reader so the stream may outlive its creator.
 */
class PartStreamBuf : public std::streambuf {
public:
    explicit PartStreamBuf(std::shared_ptr<MultipartReader> reader);

protected:
    int_type underflow() override;

private:
    std::shared_ptr<MultipartReader> reader_;
    std::array<char, 64 * 1024> buffer_;
};

/**
 * Input stream over the body of the current part. Reader failures are
 * rethrown from the stream operations instead of only setting badbit.
 */
class PartStream : public std::istream {
public:
    explicit PartStream(std::shared_ptr<MultipartReader> reader);

private:
    PartStreamBuf buf_;
};

} // namespace http
} // namespace chunkstash
