#pragma once

#include <cstddef>
#include <istream>
#include <iterator>
#include <string>
#include <unordered_map>
#include "const/rest_enums.hpp"

namespace chunkstash {
namespace http {

/**
 * HTTP Request object. The body is not read by the server; handlers pull
 * it from the stream, which ends after Content-Length bytes.
 */
struct Request {
    HttpRequest method = HttpRequest::GET;
    std::string path;                                      // Clean path without query string
    std::unordered_map<std::string, std::string> headers;  // Lower-cased header names
    std::size_t contentLength = 0;
    std::istream* body = nullptr;

    std::string getHeader(const std::string& name, const std::string& defaultValue = "") const {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : defaultValue;
    }

    std::string contentType() const { return getHeader("content-type"); }

    // Reads the whole remaining body. Only meant for small bodies such as JSON.
    std::string readBody() const {
        if (!body) return {};
        return std::string(std::istreambuf_iterator<char>(*body), std::istreambuf_iterator<char>());
    }
};

/**
 * HTTP Response object
 */
struct Response {
    int status = 200;
    std::string contentType = "text/plain";
    std::string body;

    static Response ok(const std::string& body) {
        return {200, "text/plain", body};
    }

    static Response badRequest(const std::string& message) {
        return {400, "text/plain", message};
    }

    static Response notFound(const std::string& message = "Not Found") {
        return {404, "text/plain", message};
    }

    static Response methodNotAllowed() {
        return {405, "text/plain", "Method Not Allowed"};
    }

    static Response lengthRequired() {
        return {411, "text/plain", "Length Required"};
    }

    static Response error(const std::string& message) {
        return {500, "text/plain", message};
    }
};

} // namespace http
} // namespace chunkstash
