#include "upload/ChunkStore.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace chunkstash {
namespace upload {

ChunkStore::ChunkStore(const config::UploadConfig& config)
    : layout_(config.chunkRoot), maxChunkSize_(config.maxChunkSize) {}

uint64_t ChunkStore::storeChunk(ChunkDescriptor& chunk) const {
    std::string uploadDir;
    std::string chunkPath;
    try {
        uploadDir = layout_.stagingDirectory(chunk.uploadId);
        chunkPath = layout_.chunkPath(chunk.uploadId, chunk.chunkNumber);
    } catch (const std::invalid_argument& e) {
        throw StoreError(chunk.uploadId, e.what());
    }
    // A decoded chunk carries the directory it was derived for
    if (!chunk.uploadDir.empty() && chunk.uploadDir != uploadDir) {
        throw StoreError(chunk.uploadDir, "upload directory " + chunk.uploadDir +
                         " does not belong to upload " + chunk.uploadId);
    }
    if (!chunk.data) {
        throw StoreError(uploadDir, "chunk " + std::to_string(chunk.chunkNumber) + " has no data");
    }

    // Let's create the dir to store the file chunks.
    std::error_code ec;
    std::filesystem::create_directories(uploadDir, ec);
    if (ec || !std::filesystem::is_directory(uploadDir)) {
        throw StoreError(uploadDir, "failed creating upload directory " + uploadDir + ": " +
                         (ec ? ec.message() : std::string("not a directory")));
    }

    std::ofstream chunkFile(chunkPath, std::ios::binary | std::ios::trunc);
    if (!chunkFile) {
        throw StoreError(chunkPath, "failed creating chunk file " + chunkPath + " (" + strerror(errno) + ")");
    }

    std::vector<char> buffer(64 * 1024);
    uint64_t written = 0;
    while (written < maxChunkSize_) {
        std::streamsize want = static_cast<std::streamsize>(
            std::min<uint64_t>(buffer.size(), maxChunkSize_ - written));
        std::streamsize got = 0;
        try {
            chunk.data->read(buffer.data(), want);
            got = chunk.data->gcount();
        } catch (const std::exception& e) {
            throw StoreError(chunkPath, "failed reading chunk data for " + chunkPath + ": " + e.what());
        }
        if (chunk.data->bad()) {
            throw StoreError(chunkPath, "failed reading chunk data for " + chunkPath);
        }

        if (got > 0) {
            chunkFile.write(buffer.data(), got);
            if (!chunkFile) {
                throw StoreError(chunkPath, "failed writing chunk file " + chunkPath + " (" + strerror(errno) + ")");
            }
            written += static_cast<uint64_t>(got);
        }
        if (got < want) {
            break;  // end of chunk data
        }
    }

    chunkFile.close();
    if (!chunkFile) {
        throw StoreError(chunkPath, "failed closing chunk file " + chunkPath + " (" + strerror(errno) + ")");
    }

    std::cout << "Stored chunk " << chunk.chunkNumber << " of upload " << chunk.uploadId
              << " (" << written << " bytes) at " << chunkPath << std::endl;
    return written;
}

} // namespace upload
} // namespace chunkstash
