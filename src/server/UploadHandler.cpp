#include "server/UploadHandler.hpp"
#include <iostream>
#include <limits>
#include <stdexcept>

namespace chunkstash {

namespace {

std::string requireString(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        throw std::invalid_argument(std::string("Missing required field: ") + key);
    }
    if (!j[key].is_string() || j[key].get<std::string>().empty()) {
        throw std::invalid_argument(std::string(key) + " must be a non-empty string");
    }
    return j[key].get<std::string>();
}

} // namespace

CompletionRequest CompletionRequest::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Completion request must be a JSON object");
    }

    CompletionRequest request;
    request.uploadId = requireString(j, "uploadId");
    request.filename = requireString(j, "filename");

    if (j.contains("totalChunks") && !j["totalChunks"].is_null()) {
        const auto& total = j["totalChunks"];
        if (!total.is_number_integer() || total.get<int64_t>() <= 0 ||
            total.get<int64_t>() > std::numeric_limits<int32_t>::max()) {
            throw std::invalid_argument("totalChunks must be a positive integer");
        }
        request.totalChunks = static_cast<int32_t>(total.get<int64_t>());
    }
    return request;
}

UploadHandler::UploadHandler(const config::UploadConfig& config)
    : decoder_(config), store_(config), rebuilder_(config), verifyComplete_(config.verifyComplete) {}

void UploadHandler::processChunk(std::istream& body, const std::string& contentType) const {
    upload::ChunkDescriptor chunk;
    try {
        chunk = decoder_.decode(body, contentType);
    } catch (const upload::DecodeError& e) {
        throw upload::DecodeError(e.field(), std::string("failed to parse chunk: ") + e.what());
    }

    store_.storeChunk(chunk);
}

upload::RebuildResult UploadHandler::completeChunk(const CompletionRequest& request) const {
    if (verifyComplete_ && request.totalChunks) {
        return rebuilder_.completeUpload(request.uploadId, request.filename, *request.totalChunks);
    }
    return rebuilder_.completeUpload(request.uploadId, request.filename);
}

http::Response UploadHandler::handleChunk(http::Request& request) const {
    if (!request.body) {
        return http::Response::badRequest("Missing request body");
    }

    try {
        processChunk(*request.body, request.contentType());
    } catch (const upload::UploadError& e) {
        std::cerr << "Chunk upload failed: " << e.what() << std::endl;
        return http::Response::error(e.what());
    }

    return http::Response::ok("chunk processed");
}

http::Response UploadHandler::handleComplete(http::Request& request) const {
    CompletionRequest payload;
    try {
        nlohmann::json j = nlohmann::json::parse(request.readBody());
        payload = CompletionRequest::fromJson(j);
    } catch (const nlohmann::json::parse_error& e) {
        return http::Response::badRequest(std::string("Invalid JSON: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return http::Response::badRequest(e.what());
    }

    try {
        upload::RebuildResult result = completeChunk(payload);
        std::cout << "Completed upload " << payload.uploadId << " -> " << result.destination
                  << " (" << result.bytes << " bytes)" << std::endl;
    } catch (const upload::RebuildError& e) {
        std::cerr << "Completing upload " << payload.uploadId << " failed at "
                  << upload::to_string(e.stage()) << ": " << e.what() << std::endl;
        if (!e.stagingPreserved()) {
            return http::Response::error(std::string("staged chunks were removed: ") + e.what());
        }
        return http::Response::error(e.what());
    }

    return http::Response::ok("file processed");
}

} // namespace chunkstash
