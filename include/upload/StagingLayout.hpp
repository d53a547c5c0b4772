#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace chunkstash {
namespace upload {

/**
 * On-disk layout of staged chunks:
 *
 *   <chunk root>/<upload id>/<chunk number>
 *
 * One directory per upload, one file per chunk named by its decimal index.
 */
class StagingLayout {
public:
    explicit StagingLayout(const std::string& chunkRoot);

    const std::string& chunkRoot() const { return chunkRoot_; }

    // Throws std::invalid_argument if uploadId cannot name a directory
    std::string stagingDirectory(const std::string& uploadId) const;

    std::string chunkPath(const std::string& uploadId, int32_t chunkNumber) const;

    // Non-empty, no path separators, not "." or ".."
    static bool isValidUploadId(const std::string& uploadId);

    // Index encoded in a chunk file name. Names that are not integers map to 0.
    static int64_t chunkIndexFromName(const std::string& name);

    // Strict base-10 parse: optional sign, digits only, within [min, max]
    static std::optional<int64_t> parseInteger(const std::string& text, int64_t min, int64_t max);

private:
    std::string chunkRoot_;
};

} // namespace upload
} // namespace chunkstash
