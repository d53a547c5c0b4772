#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <string>

namespace chunkstash {
namespace upload {

/**
 * One decoded chunk request. Everything needed to put the full file back
 * together once all chunks of the upload have arrived.
 */
struct ChunkDescriptor {
    std::string uploadId;           // unique id for the current upload
    int32_t chunkNumber = 0;
    int32_t totalChunks = 0;
    int64_t totalFileSize = 0;      // in bytes
    std::string filename;
    std::string uploadDir;          // staging directory derived from uploadId
    std::unique_ptr<std::istream> data;  // unread payload
};

} // namespace upload
} // namespace chunkstash
