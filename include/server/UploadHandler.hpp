#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "config/Config.hpp"
#include "http/Request.hpp"
#include "upload/ChunkDecoder.hpp"
#include "upload/ChunkStore.hpp"
#include "upload/Rebuilder.hpp"

namespace chunkstash {

// Body of a completion request
struct CompletionRequest {
    std::string uploadId;
    std::string filename;
    std::optional<int32_t> totalChunks;

    // Throws std::invalid_argument when a field is missing or has the wrong type
    static CompletionRequest fromJson(const nlohmann::json& j);
};

class UploadHandler {
public:
    explicit UploadHandler(const config::UploadConfig& config);

    // POST /upload-chunk
    http::Response handleChunk(http::Request& request) const;

    // POST /completed-chunks
    http::Response handleComplete(http::Request& request) const;

    // Parses the chunk data from the request body and stores it on disk
    void processChunk(std::istream& body, const std::string& contentType) const;

    // Rebuilds the chunks of an upload into the original file
    upload::RebuildResult completeChunk(const CompletionRequest& request) const;

private:
    upload::ChunkDecoder decoder_;
    upload::ChunkStore store_;
    upload::Rebuilder rebuilder_;
    bool verifyComplete_;
};

} // namespace chunkstash
