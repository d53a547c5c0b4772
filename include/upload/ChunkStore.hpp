#pragma once

#include <cstdint>
#include <string>
#include "config/Config.hpp"
#include "upload/ChunkDescriptor.hpp"
#include "upload/StagingLayout.hpp"
#include "upload/UploadErrors.hpp"

namespace chunkstash {
namespace upload {

class ChunkStore {
public:
    explicit ChunkStore(const config::UploadConfig& config);

    /**
     * Stores the chunk on disk for it to be processed later, once all other
     * chunks of the upload have arrived. Creates the staging directory if
     * needed and overwrites a chunk stored earlier under the same index.
     *
     * At most maxChunkSize bytes are copied; anything past that is left
     * unread.
     *
     * The chunk path is always derived from uploadId and chunkNumber; a
     * non-empty uploadDir that does not match is rejected.
     *
     * @return Number of bytes written
     * @throws StoreError
     */
    uint64_t storeChunk(ChunkDescriptor& chunk) const;

    const StagingLayout& layout() const { return layout_; }
    uint64_t maxChunkSize() const { return maxChunkSize_; }

private:
    StagingLayout layout_;
    uint64_t maxChunkSize_;
};

} // namespace upload
} // namespace chunkstash
