#include "storage/TempFile.hpp"
#include <chrono>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <random>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace chunkstash {
namespace storage {

namespace {
    constexpr int kCreateAttempts = 8;
}

TempFile::TempFile(const std::string& prefix) {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        throw std::runtime_error("Failed to locate temp directory: " + ec.message());
    }

    for (int attempt = 0; attempt < kCreateAttempts; ++attempt) {
        std::string candidate = (dir / generateUniqueFilename(prefix)).string();
        if (std::filesystem::exists(candidate, ec)) continue;

        stream_.open(candidate, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
        if (stream_) {
            path_ = candidate;
            return;
        }
        stream_.clear();
    }
    throw std::runtime_error("Failed to create temp file in " + dir.string() + " (" + strerror(errno) + ")");
}

TempFile::~TempFile() {
    stream_.close();
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

void TempFile::copyTo(std::ostream& out) {
    stream_.flush();
    stream_.seekg(0, std::ios::beg);
    if (!stream_) {
        throw std::runtime_error("Failed to rewind temp file " + path_);
    }

    std::vector<char> buffer(64 * 1024);
    while (stream_) {
        stream_.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = stream_.gcount();
        if (got > 0) {
            out.write(buffer.data(), got);
            if (!out) {
                throw std::runtime_error(std::string("Failed writing output (") + strerror(errno) + ")");
            }
        }
    }
    if (stream_.bad()) {
        throw std::runtime_error("Failed reading temp file " + path_);
    }
    stream_.clear();
}

std::string TempFile::generateUniqueFilename(const std::string& prefix) {
    // Generate a timestamp
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    // Generate a random number for additional uniqueness
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(100000, 999999);

    std::ostringstream ss;
    ss << prefix << millis << "_" << dis(gen);
    return ss.str();
}

} // namespace storage
} // namespace chunkstash
