#include <curl/curl.h>
#include <filesystem>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "client/UploadClient.hpp"

namespace {

void PrintUsage() {
    std::cerr << "Usage: chunkstash-upload <file> [--server URL] [--chunk-size BYTES] [--name TARGET]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }

    std::string path = argv[1];
    std::string server = "http://localhost:8080";
    std::string target = std::filesystem::path(path).filename().string();
    uint64_t chunk_size = 5ULL << 20;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "missing value for " << arg << "\n";
            PrintUsage();
            return 1;
        }
        std::string value = argv[++i];
        if (arg == "--server") {
            server = value;
        } else if (arg == "--name") {
            target = value;
        } else if (arg == "--chunk-size") {
            try {
                size_t parsed = 0;
                chunk_size = std::stoull(value, &parsed);
                if (parsed != value.size() || chunk_size == 0) throw std::invalid_argument(value);
            } catch (const std::exception&) {
                std::cerr << "invalid chunk size: " << value << "\n";
                return 1;
            }
        } else {
            std::cerr << "unknown option: " << arg << "\n";
            PrintUsage();
            return 1;
        }
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int rc = 0;
    try {
        chunkstash::client::UploadClient client(server);
        client.uploadFile(path, target, chunk_size);
    } catch (const std::exception& e) {
        std::cerr << "Upload failed: " << e.what() << std::endl;
        rc = 2;
    }
    curl_global_cleanup();
    return rc;
}
