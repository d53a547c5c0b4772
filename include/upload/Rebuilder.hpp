#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "config/Config.hpp"
#include "upload/StagingLayout.hpp"
#include "upload/UploadErrors.hpp"

namespace chunkstash {
namespace upload {

struct StagedChunk {
    int64_t index = 0;      // parsed from the file name, 0 if it is not a number
    std::string name;
    std::string path;
};

struct RebuildResult {
    std::size_t chunks = 0;
    uint64_t bytes = 0;
    std::string destination;
};

/**
 * Rebuilds an upload from its staged chunks.
 *
 * Not safe to run while a chunk for the same upload is still being stored;
 * callers have to make sure every chunk request has finished.
 */
class Rebuilder {
public:
    explicit Rebuilder(const config::UploadConfig& config);

    /**
     * Concatenates the chunks of uploadId in ascending numeric order into
     * filename and removes the staging directory.
     *
     * By default the staging directory is removed before filename is
     * written, so a failure in that last step loses the staged chunks
     * (RebuildError::stagingPreserved() is false). With
     * writeDestinationFirst the order is reversed.
     *
     * @throws RebuildError
     */
    RebuildResult completeUpload(const std::string& uploadId, const std::string& filename) const;

    // Same, but first checks that no chunk in [first, first + totalChunks) is missing
    RebuildResult completeUpload(const std::string& uploadId, const std::string& filename,
                                 int32_t totalChunks) const;

    // Staged chunks of uploadId in rebuild order. Throws RebuildError.
    std::vector<StagedChunk> listChunks(const std::string& uploadId) const;

    /**
     * Indices missing from [first, first + totalChunks), where first is 0
     * if chunk 0 is staged and 1 otherwise.
     */
    std::vector<int64_t> missingChunks(const std::string& uploadId, int32_t totalChunks) const;

private:
    StagingLayout layout_;
    bool writeDestinationFirst_;

    std::string stagingDirectory(const std::string& uploadId) const;
    static std::vector<int64_t> missingIndices(const std::vector<StagedChunk>& chunks, int32_t totalChunks);
};

} // namespace upload
} // namespace chunkstash
