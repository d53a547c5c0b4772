#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include "config/Config.hpp"
#include "http/MultipartReader.hpp"
#include "upload/ChunkDescriptor.hpp"
#include "upload/StagingLayout.hpp"
#include "upload/UploadErrors.hpp"

namespace chunkstash {
namespace upload {

/**
 * Decodes a chunk upload request.
 *
 * The multipart body must carry, in this order:
 *   1. upload_id
 *   2. chunk_number
 *   3. total_chunks
 *   4. total_file_size
 *   5. file_name
 *   6. the chunk data (any name)
 *
 * Decoding does no disk I/O. The returned descriptor holds the chunk data
 * as an unread stream positioned at the start of part 6.
 */
class ChunkDecoder {
public:
    static constexpr std::size_t kMaxFieldSize = 64 * 1024;

    explicit ChunkDecoder(const config::UploadConfig& config);

    // Throws DecodeError
    ChunkDescriptor decode(std::istream& body, const std::string& contentType) const;
    ChunkDescriptor decode(std::shared_ptr<http::MultipartReader> reader) const;

private:
    StagingLayout layout_;

    std::string readField(http::MultipartReader& reader, const std::string& expected) const;
    int64_t readInteger(http::MultipartReader& reader, const std::string& expected,
                        int64_t min, int64_t max) const;
};

} // namespace upload
} // namespace chunkstash
