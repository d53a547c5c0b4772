#include "client/UploadClient.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>

namespace chunkstash {
namespace client {

namespace {
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    using MimeHandle = std::unique_ptr<curl_mime, decltype(&curl_mime_free)>;
    using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

    size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
        size_t totalSize = size * nmemb;
        userp->append(static_cast<char*>(contents), totalSize);
        return totalSize;
    }

    // Performs a prepared request and checks for a 200 answer
    std::string perform(CURL* curl, const std::string& url, long timeout) {
        std::string response;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);

        CURLcode res = curl_easy_perform(curl);

        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

        if (res != CURLE_OK) {
            throw std::runtime_error(std::string("CURL error: ") + curl_easy_strerror(res));
        }
        if (httpCode != 200) {
            throw std::runtime_error("HTTP error " + std::to_string(httpCode) + " from " + url + ": " + response);
        }
        return response;
    }

    void addField(curl_mime* mime, const char* name, const std::string& value) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, name);
        curl_mime_data(part, value.c_str(), value.size());
    }
}

std::vector<ChunkPlan> planChunks(uint64_t fileSize, uint64_t chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }

    uint64_t count = fileSize == 0 ? 1 : (fileSize + chunkSize - 1) / chunkSize;
    if (count > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
        throw std::invalid_argument("file needs more than " +
                                    std::to_string(std::numeric_limits<int32_t>::max()) + " chunks");
    }

    std::vector<ChunkPlan> plan;
    plan.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        ChunkPlan chunk;
        chunk.number = static_cast<int32_t>(i);
        chunk.offset = i * chunkSize;
        chunk.length = std::min(chunkSize, fileSize - chunk.offset);
        plan.push_back(chunk);
    }
    return plan;
}

std::string generateUploadId() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(16) << gen() << std::setw(16) << gen();
    return ss.str();
}

UploadClient::UploadClient(const std::string& baseUrl) : baseUrl_(baseUrl) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

void UploadClient::postChunk(const std::string& uploadId, const ChunkPlan& chunk, int32_t totalChunks,
                             uint64_t totalFileSize, const std::string& targetName,
                             const std::vector<char>& data) {
    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    // The server reads the fields in exactly this order
    MimeHandle mime(curl_mime_init(curl.get()), &curl_mime_free);
    addField(mime.get(), "upload_id", uploadId);
    addField(mime.get(), "chunk_number", std::to_string(chunk.number));
    addField(mime.get(), "total_chunks", std::to_string(totalChunks));
    addField(mime.get(), "total_file_size", std::to_string(totalFileSize));
    addField(mime.get(), "file_name", targetName);

    static const char empty = '\0';
    curl_mimepart* payload = curl_mime_addpart(mime.get());
    curl_mime_name(payload, "chunk");
    curl_mime_filename(payload, "blob");
    curl_mime_type(payload, "application/octet-stream");
    curl_mime_data(payload, data.empty() ? &empty : data.data(), data.size());

    // The server never sends 100 Continue
    HeaderList headerList(curl_slist_append(nullptr, "Expect:"), &curl_slist_free_all);

    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    perform(curl.get(), baseUrl_ + "/upload-chunk", timeout_);
}

void UploadClient::postCompletion(const std::string& uploadId, const std::string& targetName,
                                  int32_t totalChunks) {
    nlohmann::json requestBody = {
        {"uploadId", uploadId},
        {"filename", targetName},
        {"totalChunks", totalChunks}
    };
    std::string body = requestBody.dump();

    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    HeaderList headerList(curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all);

    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    perform(curl.get(), baseUrl_ + "/completed-chunks", timeout_);
}

std::string UploadClient::uploadFile(const std::string& path, const std::string& targetName,
                                     uint64_t chunkSize) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    uint64_t fileSize = static_cast<uint64_t>(file.tellg());
    file.seekg(0, std::ios::beg);

    std::vector<ChunkPlan> plan = planChunks(fileSize, chunkSize);
    const int32_t totalChunks = static_cast<int32_t>(plan.size());
    const std::string uploadId = generateUploadId();

    std::cout << "Uploading " << path << " (" << fileSize << " bytes) in " << totalChunks
              << " chunks as upload " << uploadId << std::endl;

    std::vector<char> data;
    for (const auto& chunk : plan) {
        data.resize(static_cast<size_t>(chunk.length));
        file.read(data.data(), static_cast<std::streamsize>(chunk.length));
        if (static_cast<uint64_t>(file.gcount()) != chunk.length) {
            throw std::runtime_error("Failed reading chunk " + std::to_string(chunk.number) + " of " + path);
        }

        postChunk(uploadId, chunk, totalChunks, fileSize, targetName, data);
        std::cout << "  chunk " << (chunk.number + 1) << "/" << totalChunks
                  << " (" << chunk.length << " bytes)" << std::endl;
    }

    postCompletion(uploadId, targetName, totalChunks);
    std::cout << "Upload " << uploadId << " completed as " << targetName << std::endl;
    return uploadId;
}

} // namespace client
} // namespace chunkstash
