#include <iostream>
#include <string>

#include "config/ConfigLoader.hpp"
#include "server/HttpServer.hpp"
#include "server/endpoint.hpp"
#include "server/UploadHandler.hpp"
#include "const/rest_enums.hpp"

using namespace chunkstash;

int main(int argc, char** argv)
{
    std::string config_path;
    if (argc == 2) {
        config_path = argv[1];
    } else if (argc == 3 && std::string(argv[1]) == "--config") {
        config_path = argv[2];
    } else if (argc != 1) {
        std::cerr << "Usage: chunkstash [<config.yaml> | --config <config.yaml>]" << std::endl;
        return 1;
    }

    try {
        config::Config cfg;
        if (!config_path.empty()) {
            cfg = config::ConfigLoader::loadFromYaml(config_path);
        }
        std::cout << "Chunk root: " << cfg.upload.chunkRoot
                  << ", max chunk size: " << cfg.upload.maxChunkSize << " bytes" << std::endl;

        HttpServer server(cfg.server);
        UploadHandler uploadHandler(cfg.upload);

        endpoint chunk_ep(
            [&uploadHandler](http::Request& req) { return uploadHandler.handleChunk(req); },
            http::HttpRequest::POST,
            "/upload-chunk"
        );
        server.add_endpoint(chunk_ep);

        endpoint complete_ep(
            [&uploadHandler](http::Request& req) { return uploadHandler.handleComplete(req); },
            http::HttpRequest::POST,
            "/completed-chunks"
        );
        server.add_endpoint(complete_ep);

        server.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 2;
    }

    return 0;
}
