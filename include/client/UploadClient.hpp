#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chunkstash {
namespace client {

struct ChunkPlan {
    int32_t number = 0;
    uint64_t offset = 0;
    uint64_t length = 0;
};

// Splits fileSize bytes into consecutive 0-based chunks of at most chunkSize.
// An empty file still gets one empty chunk so the upload can be completed.
std::vector<ChunkPlan> planChunks(uint64_t fileSize, uint64_t chunkSize);

// 32 random hex characters
std::string generateUploadId();

class UploadClient {
public:
    explicit UploadClient(const std::string& baseUrl = "http://localhost:8080");

    // Uploads path chunk by chunk and asks the server to rebuild it as targetName.
    // Returns the upload id. Throws std::runtime_error on any failure.
    std::string uploadFile(const std::string& path, const std::string& targetName,
                           uint64_t chunkSize = 5ULL << 20);

    // Set request timeout in seconds (default: 60)
    void setTimeout(long seconds) { timeout_ = seconds; }

private:
    std::string baseUrl_;
    long timeout_ = 60;

    void postChunk(const std::string& uploadId, const ChunkPlan& chunk, int32_t totalChunks,
                   uint64_t totalFileSize, const std::string& targetName,
                   const std::vector<char>& data);

    void postCompletion(const std::string& uploadId, const std::string& targetName,
                        int32_t totalChunks);
};

} // namespace client
} // namespace chunkstash
