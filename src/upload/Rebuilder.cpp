#include "upload/Rebuilder.hpp"
#include "storage/TempFile.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>

namespace chunkstash {
namespace upload {

namespace {

constexpr std::size_t kMaxReportedMissing = 20;

uint64_t appendChunk(const StagedChunk& chunk, std::ostream& out) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(chunk.path, ec)) {
        throw std::runtime_error("chunk " + chunk.path + " is not a regular file");
    }

    std::ifstream src(chunk.path, std::ios::binary);
    if (!src) {
        throw std::runtime_error("failed opening chunk " + chunk.path + " (" + strerror(errno) + ")");
    }

    char buffer[64 * 1024];
    uint64_t copied = 0;
    while (src) {
        src.read(buffer, sizeof(buffer));
        std::streamsize got = src.gcount();
        if (got > 0) {
            out.write(buffer, got);
            if (!out) {
                throw std::runtime_error("failed appending chunk " + chunk.path + " (" + strerror(errno) + ")");
            }
            copied += static_cast<uint64_t>(got);
        }
    }
    if (src.bad()) {
        throw std::runtime_error("failed reading chunk " + chunk.path + " (" + strerror(errno) + ")");
    }
    return copied;
}

void writeDestination(storage::TempFile& fullFile, const std::string& filename) {
    std::ofstream newFile(filename, std::ios::binary | std::ios::trunc);
    if (!newFile) {
        throw std::runtime_error("failed creating file " + filename + " (" + strerror(errno) + ")");
    }
    try {
        fullFile.copyTo(newFile);
    } catch (const std::exception& e) {
        throw std::runtime_error("failed copying file contents to " + filename + ": " + e.what());
    }
    newFile.close();
    if (!newFile) {
        throw std::runtime_error("failed closing file " + filename + " (" + strerror(errno) + ")");
    }
}

void removeStaging(const std::string& uploadDir) {
    std::error_code ec;
    std::filesystem::remove_all(uploadDir, ec);
    if (ec) {
        throw std::runtime_error("failed removing upload directory " + uploadDir + ": " + ec.message());
    }
}

} // namespace

Rebuilder::Rebuilder(const config::UploadConfig& config)
    : layout_(config.chunkRoot), writeDestinationFirst_(config.writeDestinationFirst) {}

std::string Rebuilder::stagingDirectory(const std::string& uploadId) const {
    try {
        return layout_.stagingDirectory(uploadId);
    } catch (const std::invalid_argument& e) {
        throw RebuildError(RebuildStage::ListChunks, true, std::string("failed to rebuild file: ") + e.what());
    }
}

std::vector<StagedChunk> Rebuilder::listChunks(const std::string& uploadId) const {
    const std::string uploadDir = stagingDirectory(uploadId);

    std::vector<StagedChunk> chunks;
    try {
        for (const auto& entry : std::filesystem::directory_iterator(uploadDir)) {
            StagedChunk chunk;
            chunk.name = entry.path().filename().string();
            chunk.path = entry.path().string();
            chunk.index = StagingLayout::chunkIndexFromName(chunk.name);
            chunks.push_back(std::move(chunk));
        }
    } catch (const std::filesystem::filesystem_error& e) {
        throw RebuildError(RebuildStage::ListChunks, true,
                           "failed to rebuild file: failed listing chunks in " + uploadDir + ": " +
                           e.code().message());
    }

    // Directory order is unspecified; order by name first so that names
    // sharing an index (malformed ones all count as 0) keep a fixed order.
    std::sort(chunks.begin(), chunks.end(),
              [](const StagedChunk& a, const StagedChunk& b) { return a.name < b.name; });
    std::stable_sort(chunks.begin(), chunks.end(),
                     [](const StagedChunk& a, const StagedChunk& b) { return a.index < b.index; });
    return chunks;
}

std::vector<int64_t> Rebuilder::missingIndices(const std::vector<StagedChunk>& chunks, int32_t totalChunks) {
    std::set<int64_t> present;
    for (const auto& chunk : chunks) {
        auto index = StagingLayout::parseInteger(chunk.name, std::numeric_limits<int64_t>::min(),
                                                 std::numeric_limits<int64_t>::max());
        if (index) present.insert(*index);
    }

    const int64_t first = present.count(0) ? 0 : 1;
    std::vector<int64_t> missing;
    for (int64_t i = first; i < first + totalChunks; ++i) {
        if (present.count(i) == 0) missing.push_back(i);
    }
    return missing;
}

std::vector<int64_t> Rebuilder::missingChunks(const std::string& uploadId, int32_t totalChunks) const {
    return missingIndices(listChunks(uploadId), totalChunks);
}

RebuildResult Rebuilder::completeUpload(const std::string& uploadId, const std::string& filename,
                                        int32_t totalChunks) const {
    if (totalChunks <= 0) {
        throw RebuildError(RebuildStage::VerifyComplete, true,
                           "invalid total chunk count " + std::to_string(totalChunks));
    }

    std::vector<int64_t> missing = missingIndices(listChunks(uploadId), totalChunks);
    if (!missing.empty()) {
        std::ostringstream msg;
        msg << "upload " << uploadId << " is incomplete: " << missing.size() << " of "
            << totalChunks << " chunks missing (";
        for (std::size_t i = 0; i < missing.size() && i < kMaxReportedMissing; ++i) {
            if (i > 0) msg << ", ";
            msg << missing[i];
        }
        if (missing.size() > kMaxReportedMissing) msg << ", ...";
        msg << ")";
        throw RebuildError(RebuildStage::VerifyComplete, true, msg.str());
    }

    return completeUpload(uploadId, filename);
}

RebuildResult Rebuilder::completeUpload(const std::string& uploadId, const std::string& filename) const {
    if (filename.empty()) {
        throw RebuildError(RebuildStage::WriteDestination, true, "failed creating file: empty filename");
    }

    const std::string uploadDir = stagingDirectory(uploadId);
    std::vector<StagedChunk> chunks = listChunks(uploadId);

    std::unique_ptr<storage::TempFile> fullFile;
    try {
        fullFile = std::make_unique<storage::TempFile>("fullfile-");
    } catch (const std::exception& e) {
        throw RebuildError(RebuildStage::CreateAccumulator, true,
                           std::string("failed to rebuild file: ") + e.what());
    }

    RebuildResult result;
    result.destination = filename;
    for (const auto& chunk : chunks) {
        try {
            result.bytes += appendChunk(chunk, fullFile->stream());
        } catch (const std::exception& e) {
            throw RebuildError(RebuildStage::AppendChunk, true,
                               std::string("failed to rebuild file: ") + e.what());
        }
        ++result.chunks;
    }

    if (writeDestinationFirst_) {
        try {
            writeDestination(*fullFile, filename);
        } catch (const std::exception& e) {
            throw RebuildError(RebuildStage::WriteDestination, true, e.what());
        }
        try {
            removeStaging(uploadDir);
        } catch (const std::exception& e) {
            throw RebuildError(RebuildStage::Cleanup, false, e.what());
        }
    } else {
        try {
            removeStaging(uploadDir);
        } catch (const std::exception& e) {
            throw RebuildError(RebuildStage::Cleanup, false, std::string("failed to rebuild file: ") + e.what());
        }
        try {
            writeDestination(*fullFile, filename);
        } catch (const std::exception& e) {
            throw RebuildError(RebuildStage::WriteDestination, false, e.what());
        }
    }

    std::cout << "Rebuilt upload " << uploadId << " from " << result.chunks << " chunks ("
              << result.bytes << " bytes) into " << filename << std::endl;
    return result;
}

} // namespace upload
} // namespace chunkstash
