#include "upload/StagingLayout.hpp"
#include <charconv>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace chunkstash {
namespace upload {

StagingLayout::StagingLayout(const std::string& chunkRoot)
    : chunkRoot_(chunkRoot) {}

std::string StagingLayout::stagingDirectory(const std::string& uploadId) const {
    if (!isValidUploadId(uploadId)) {
        throw std::invalid_argument("invalid upload id '" + uploadId + "'");
    }
    return chunkRoot_ + "/" + uploadId;
}

std::string StagingLayout::chunkPath(const std::string& uploadId, int32_t chunkNumber) const {
    return stagingDirectory(uploadId) + "/" + std::to_string(chunkNumber);
}

bool StagingLayout::isValidUploadId(const std::string& uploadId) {
    if (uploadId.empty() || uploadId == "." || uploadId == "..") {
        return false;
    }
    return uploadId.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

std::optional<int64_t> StagingLayout::parseInteger(const std::string& text, int64_t min, int64_t max) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (first != last && *first == '+') {
        ++first;
        // "+-1" is not a number
        if (first != last && *first == '-') return std::nullopt;
    }
    if (first == last) return std::nullopt;

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value, 10);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    if (value < min || value > max) {
        return std::nullopt;
    }
    return value;
}

int64_t StagingLayout::chunkIndexFromName(const std::string& name) {
    return parseInteger(name, std::numeric_limits<int64_t>::min(),
                        std::numeric_limits<int64_t>::max()).value_or(0);
}

} // namespace upload
} // namespace chunkstash
