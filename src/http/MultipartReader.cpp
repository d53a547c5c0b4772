#include "http/MultipartReader.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace chunkstash {
namespace http {

namespace {
    constexpr std::size_t kReadBlock = 16 * 1024;
    constexpr std::size_t kMaxHeaderLine = 8 * 1024;
    constexpr std::size_t kMaxHeaderCount = 32;
}

// The window starts with a CRLF so that a body opening directly with the
// first boundary line matches the same delimiter as every later boundary.
MultipartReader::MultipartReader(std::istream& body, const std::string& boundary)
    : body_(body), delimiter_("\r\n--" + boundary), buffer_("\r\n") {
    if (boundary.empty()) {
        throw MultipartError("multipart boundary is empty");
    }
}

void MultipartReader::trim(std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && (s[start] == ' ' || s[start] == '\t')) ++start;
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' ||
                            s[end - 1] == '\r' || s[end - 1] == '\n')) --end;
    s = s.substr(start, end - start);
}

void MultipartReader::toLower(std::string& s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
}

void MultipartReader::parseContentDisposition(const std::string& value,
                                              std::string& name,
                                              std::string& filename) {
    size_t pos = 0;
    bool first = true;
    bool formData = false;
    while (pos < value.size()) {
        size_t next = value.find(';', pos);
        std::string token = value.substr(pos, (next == std::string::npos ? value.size() : next) - pos);
        pos = (next == std::string::npos ? value.size() : next + 1);

        trim(token);
        if (first) {
            // Disposition type
            first = false;
            toLower(token);
            formData = (token == "form-data");
            continue;
        }
        if (token.empty()) continue;

        auto eq = token.find('=');
        if (eq == std::string::npos) continue;

        std::string key = token.substr(0, eq);
        std::string val = token.substr(eq + 1);
        trim(key);
        trim(val);
        toLower(key);

        // Remove surrounding quotes
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }

        if (key == "name" && formData) {
            name = val;
        } else if (key == "filename") {
            filename = val;
        }
    }
}

std::string MultipartReader::extractBoundary(const std::string& content_type) {
    std::string boundary;

    auto semicolon = content_type.find(';');
    if (semicolon == std::string::npos) {
        return boundary;
    }

    std::string params = content_type.substr(semicolon + 1);

    while (!params.empty()) {
        auto next_semi = params.find(';');
        std::string token = (next_semi == std::string::npos) ? params : params.substr(0, next_semi);
        params = (next_semi == std::string::npos) ? "" : params.substr(next_semi + 1);

        trim(token);
        if (token.empty()) continue;

        auto eq = token.find('=');
        if (eq == std::string::npos) continue;

        std::string key = token.substr(0, eq);
        std::string val = token.substr(eq + 1);
        trim(key);
        trim(val);
        toLower(key);

        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }

        if (key == "boundary") {
            boundary = val;
            break;
        }
    }

    return boundary;
}

std::string MultipartReader::mediaType(const std::string& content_type) {
    std::string mt = content_type.substr(0, content_type.find(';'));
    trim(mt);
    toLower(mt);
    return mt;
}

bool MultipartReader::fill() {
    if (eof_) return false;

    // Drop consumed bytes before growing the window
    if (pos_ > 0 && pos_ >= buffer_.size() / 2) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }

    char block[kReadBlock];
    body_.read(block, sizeof(block));
    std::streamsize got = body_.gcount();
    if (body_.bad()) {
        throw MultipartError("failed reading request body");
    }
    if (got > 0) {
        buffer_.append(block, static_cast<size_t>(got));
    }
    if (!body_) {
        eof_ = true;
    }
    return got > 0;
}

bool MultipartReader::ensure(std::size_t n) {
    while (buffer_.size() - pos_ < n) {
        if (!fill()) return false;
    }
    return true;
}

std::size_t MultipartReader::readBody(char* out, std::size_t n) {
    const size_t keep = delimiter_.size() - 1;
    while (true) {
        size_t marker = buffer_.find(delimiter_, pos_);
        if (marker == pos_) {
            pos_ += delimiter_.size();
            afterDelimiter();
            return 0;
        }

        size_t avail = 0;
        if (marker != std::string::npos) {
            avail = marker - pos_;
        } else if (buffer_.size() - pos_ > keep) {
            // The tail may hold the start of a delimiter split across reads
            avail = buffer_.size() - pos_ - keep;
        }

        if (avail > 0) {
            size_t count = std::min(n, avail);
            if (out) {
                std::memcpy(out, buffer_.data() + pos_, count);
            }
            pos_ += count;
            return count;
        }

        if (!fill()) {
            throw MultipartError("unexpected end of multipart body");
        }
    }
}

void MultipartReader::afterDelimiter() {
    if (!ensure(2)) {
        throw MultipartError("unexpected end of multipart body after boundary");
    }

    // Final boundary (--)
    if (buffer_.compare(pos_, 2, "--") == 0) {
        pos_ += 2;
        state_ = State::Done;
        return;
    }

    // Transport padding before the CRLF
    while (ensure(1) && (buffer_[pos_] == ' ' || buffer_[pos_] == '\t')) {
        ++pos_;
    }
    if (!ensure(2) || buffer_.compare(pos_, 2, "\r\n") != 0) {
        throw MultipartError("malformed multipart boundary line");
    }
    pos_ += 2;
    state_ = State::Headers;
}

PartHeaders MultipartReader::readHeaders() {
    PartHeaders part;
    size_t count = 0;

    while (true) {
        size_t eol;
        while ((eol = buffer_.find("\r\n", pos_)) == std::string::npos) {
            if (buffer_.size() - pos_ > kMaxHeaderLine) {
                throw MultipartError("multipart header line too long");
            }
            if (!fill()) {
                throw MultipartError("unexpected end of multipart headers");
            }
        }

        std::string hline = buffer_.substr(pos_, eol - pos_);
        pos_ = eol + 2;
        if (hline.empty()) break;

        if (++count > kMaxHeaderCount) {
            throw MultipartError("too many multipart headers");
        }

        auto colon = hline.find(':');
        if (colon == std::string::npos) {
            throw MultipartError("malformed multipart header: " + hline);
        }

        std::string hname = hline.substr(0, colon);
        std::string hvalue = hline.substr(colon + 1);
        trim(hname);
        trim(hvalue);
        toLower(hname);

        if (hname == "content-disposition") {
            parseContentDisposition(hvalue, part.name, part.filename);
        } else if (hname == "content-type") {
            part.content_type = hvalue;
        }
    }

    state_ = State::Body;
    return part;
}

std::optional<PartHeaders> MultipartReader::nextPart() {
    // Skip the preamble or whatever is left of the current part
    while (state_ == State::Preamble || state_ == State::Body) {
        readBody(nullptr, std::string::npos);
    }

    if (state_ == State::Done) {
        return std::nullopt;
    }
    return readHeaders();
}

std::size_t MultipartReader::read(char* out, std::size_t n) {
    if (state_ != State::Body || n == 0) return 0;
    return readBody(out, n);
}

std::string MultipartReader::readAll(std::size_t limit) {
    std::string content;
    char block[4096];
    size_t got;
    while ((got = read(block, sizeof(block))) > 0) {
        if (content.size() + got > limit) {
            throw MultipartError("multipart part exceeds " + std::to_string(limit) + " bytes");
        }
        content.append(block, got);
    }
    return content;
}

PartStreamBuf::PartStreamBuf(std::shared_ptr<MultipartReader> reader)
    : reader_(std::move(reader)) {
    setg(buffer_.data(), buffer_.data(), buffer_.data());
}

PartStreamBuf::int_type PartStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    size_t got = reader_->read(buffer_.data(), buffer_.size());
    if (got == 0) {
        return traits_type::eof();
    }
    setg(buffer_.data(), buffer_.data(), buffer_.data() + got);
    return traits_type::to_int_type(*gptr());
}

PartStream::PartStream(std::shared_ptr<MultipartReader> reader)
    : std::istream(nullptr), buf_(std::move(reader)) {
    rdbuf(&buf_);
    exceptions(std::ios::badbit);
}

} // namespace http
} // namespace chunkstash
