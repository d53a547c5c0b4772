#include "upload/UploadErrors.hpp"

namespace chunkstash {
namespace upload {

const char* to_string(RebuildStage stage) {
    switch (stage) {
        case RebuildStage::VerifyComplete: return "verify-complete";
        case RebuildStage::ListChunks: return "list-chunks";
        case RebuildStage::CreateAccumulator: return "create-accumulator";
        case RebuildStage::AppendChunk: return "append-chunk";
        case RebuildStage::Cleanup: return "cleanup";
        case RebuildStage::WriteDestination: return "write-destination";
        default: return "unknown";
    }
}

} // namespace upload
} // namespace chunkstash
