#pragma once

#include <string>
#include <stdexcept>

namespace chunkstash {
namespace http {

enum class HttpRequest {
    GET,
    POST,
    PATCH,
    PUT,
};


inline const char* to_string(HttpRequest method) {
    switch(method) {
        case HttpRequest::GET: return "GET";
        case HttpRequest::POST: return "POST";
        case HttpRequest::PATCH: return "PATCH";
        case HttpRequest::PUT: return "PUT";
        default: return "UNKNOWN";
    }
}


inline HttpRequest from_string(const std::string& method) {
    if (method == "GET") return HttpRequest::GET;
    else if (method == "POST") return HttpRequest::POST;
    else if (method == "PATCH") return HttpRequest::PATCH;
    else if (method == "PUT") return HttpRequest::PUT;
    else throw std::invalid_argument("Invalid HTTP method string: " + method);
}


inline const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 411: return "Length Required";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        default:  return "OK";
    }
}

} // namespace http
} // namespace chunkstash
