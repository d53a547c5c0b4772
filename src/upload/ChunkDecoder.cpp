#include "upload/ChunkDecoder.hpp"
#include <limits>
#include <stdexcept>

namespace chunkstash {
namespace upload {

ChunkDecoder::ChunkDecoder(const config::UploadConfig& config)
    : layout_(config.chunkRoot) {}

ChunkDescriptor ChunkDecoder::decode(std::istream& body, const std::string& contentType) const {
    if (http::MultipartReader::mediaType(contentType) != "multipart/form-data") {
        throw DecodeError("upload_id", "request Content-Type isn't multipart/form-data");
    }
    std::string boundary = http::MultipartReader::extractBoundary(contentType);
    if (boundary.empty()) {
        throw DecodeError("upload_id", "no multipart boundary param in Content-Type");
    }
    return decode(std::make_shared<http::MultipartReader>(body, boundary));
}

ChunkDescriptor ChunkDecoder::decode(std::shared_ptr<http::MultipartReader> reader) const {
    ChunkDescriptor chunk;

    // 1
    chunk.uploadId = readField(*reader, "upload_id");
    if (!StagingLayout::isValidUploadId(chunk.uploadId)) {
        throw DecodeError("upload_id", "invalid upload_id '" + chunk.uploadId + "'");
    }
    // dir to where we store our chunk
    chunk.uploadDir = layout_.stagingDirectory(chunk.uploadId);

    // 2
    chunk.chunkNumber = static_cast<int32_t>(readInteger(*reader, "chunk_number",
        std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max()));

    // 3
    chunk.totalChunks = static_cast<int32_t>(readInteger(*reader, "total_chunks",
        std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max()));

    // 4
    chunk.totalFileSize = readInteger(*reader, "total_file_size",
        std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max());

    // 5
    chunk.filename = readField(*reader, "file_name");

    // 6
    std::optional<http::PartHeaders> part;
    try {
        part = reader->nextPart();
    } catch (const std::exception& e) {
        throw DecodeError("chunk", std::string("failed reading chunk part: ") + e.what());
    }
    if (!part) {
        throw DecodeError("chunk", "failed reading chunk part: unexpected end of multipart body");
    }

    chunk.data = std::make_unique<http::PartStream>(std::move(reader));
    return chunk;
}

std::string ChunkDecoder::readField(http::MultipartReader& reader, const std::string& expected) const {
    std::optional<http::PartHeaders> part;
    try {
        part = reader.nextPart();
    } catch (const std::exception& e) {
        throw DecodeError(expected, "failed reading " + expected + " part: " + e.what());
    }
    if (!part) {
        throw DecodeError(expected, "failed reading " + expected + " part: unexpected end of multipart body");
    }

    if (part->name != expected) {
        throw FieldNameMismatch(expected, part->name);
    }

    try {
        return reader.readAll(kMaxFieldSize);
    } catch (const std::exception& e) {
        throw DecodeError(expected, "failed copying " + expected + " part: " + e.what());
    }
}

int64_t ChunkDecoder::readInteger(http::MultipartReader& reader, const std::string& expected,
                                  int64_t min, int64_t max) const {
    std::string text = readField(reader, expected);
    auto value = StagingLayout::parseInteger(text, min, max);
    if (!value) {
        throw DecodeError(expected, "invalid " + expected + " value '" + text + "'");
    }
    return *value;
}

} // namespace upload
} // namespace chunkstash
