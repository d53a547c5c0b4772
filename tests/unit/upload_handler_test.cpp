#include "server/UploadHandler.hpp"
#include "test_support.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

namespace {

using chunkstash::CompletionRequest;
using chunkstash::UploadHandler;
using chunkstash::config::UploadConfig;
using chunkstash::http::HttpRequest;
using chunkstash::http::Request;
using chunkstash::http::Response;
using chunkstash::testing::BuildMultipart;
using chunkstash::testing::ChunkBody;
using chunkstash::testing::MultipartContentType;
using chunkstash::testing::ReadFile;
using chunkstash::testing::TempDir;

UploadConfig MakeConfig(const TempDir& dir) {
  UploadConfig config;
  config.chunkRoot = dir.str("chunks");
  return config;
}

Response PostChunk(const UploadHandler& handler, const std::string& body,
                   const std::string& content_type = MultipartContentType()) {
  std::istringstream stream(body);
  Request            request;
  request.method                  = HttpRequest::POST;
  request.path                    = "/upload-chunk";
  request.headers["content-type"] = content_type;
  request.contentLength           = body.size();
  request.body                    = &stream;
  return handler.handleChunk(request);
}

Response PostCompletion(const UploadHandler& handler, const std::string& json) {
  std::istringstream stream(json);
  Request            request;
  request.method                  = HttpRequest::POST;
  request.path                    = "/completed-chunks";
  request.headers["content-type"] = "application/json";
  request.contentLength           = json.size();
  request.body                    = &stream;
  return handler.handleComplete(request);
}

void TestFullUploadThroughHandlers() {
  TempDir       dir("handler_full");
  UploadHandler handler(MakeConfig(dir));

  Response first = PostChunk(handler, ChunkBody("abc123", 0, 2, 13, "greeting.txt", "Hello, "));
  assert(first.status == 200 && first.body == "chunk processed");
  Response second = PostChunk(handler, ChunkBody("abc123", 1, 2, 13, "greeting.txt", "World!"));
  assert(second.status == 200);

  const std::string destination = dir.str("greeting.txt");
  Response done = PostCompletion(handler, R"({"uploadId":"abc123","filename":")" + destination + R"("})");
  assert(done.status == 200 && done.body == "file processed");
  assert(ReadFile(destination) == "Hello, World!");
  assert(!std::filesystem::exists(dir.path() / "chunks" / "abc123"));
}

void TestOutOfOrderPartsAreServerErrors() {
  TempDir       dir("handler_order");
  UploadHandler handler(MakeConfig(dir));

  const std::string body = BuildMultipart({{"chunk_number", "0", ""},
                                           {"upload_id", "abc", ""},
                                           {"total_chunks", "1", ""},
                                           {"total_file_size", "1", ""},
                                           {"file_name", "f", ""},
                                           {"chunk", "x", "blob"}},
                                          "chunkstash-boundary");
  Response response = PostChunk(handler, body);
  assert(response.status == 500);
  assert(response.body.find("failed to parse chunk: ") == 0);
  assert(response.body.find("Expected upload_id got chunk_number") != std::string::npos);
  assert(!std::filesystem::exists(dir.path() / "chunks" / "abc"));
}

void TestNonMultipartChunkIsServerError() {
  TempDir       dir("handler_json_chunk");
  UploadHandler handler(MakeConfig(dir));

  Response response = PostChunk(handler, "{}", "application/json");
  assert(response.status == 500);
}

void TestMissingBodyIsBadRequest() {
  TempDir       dir("handler_no_body");
  UploadHandler handler(MakeConfig(dir));

  Request request;
  request.method = HttpRequest::POST;
  assert(handler.handleChunk(request).status == 400);
}

void TestMalformedCompletionRequests() {
  TempDir       dir("handler_bad_json");
  UploadHandler handler(MakeConfig(dir));

  assert(PostCompletion(handler, "not json").status == 400);
  assert(PostCompletion(handler, "[1, 2]").status == 400);
  assert(PostCompletion(handler, R"({"filename":"x"})").status == 400);
  assert(PostCompletion(handler, R"({"uploadId":"abc"})").status == 400);
  assert(PostCompletion(handler, R"({"uploadId":"abc","filename":""})").status == 400);
  assert(PostCompletion(handler, R"({"uploadId":7,"filename":"x"})").status == 400);
  assert(PostCompletion(handler, R"({"uploadId":"abc","filename":"x","totalChunks":0})").status == 400);
  assert(PostCompletion(handler, R"({"uploadId":"abc","filename":"x","totalChunks":"2"})").status == 400);
}

void TestCompletionRequestParsing() {
  CompletionRequest plain = CompletionRequest::fromJson(nlohmann::json::parse(R"({"uploadId":"u","filename":"f"})"));
  assert(plain.uploadId == "u" && plain.filename == "f");
  assert(!plain.totalChunks);

  CompletionRequest counted =
      CompletionRequest::fromJson(nlohmann::json::parse(R"({"uploadId":"u","filename":"f","totalChunks":3})"));
  assert(counted.totalChunks && *counted.totalChunks == 3);
}

void TestUnknownUploadIsServerError() {
  TempDir       dir("handler_unknown");
  UploadHandler handler(MakeConfig(dir));

  Response response = PostCompletion(handler, R"({"uploadId":"missing","filename":")" + dir.str("x") + R"("})");
  assert(response.status == 500);
  assert(response.body.find("failed to rebuild file: ") == 0);
}

void TestLostStagingIsFlagged() {
  TempDir       dir("handler_lost");
  UploadHandler handler(MakeConfig(dir));

  assert(PostChunk(handler, ChunkBody("lost", 0, 1, 4, "x", "data")).status == 200);
  Response response =
      PostCompletion(handler, R"({"uploadId":"lost","filename":")" + dir.str("no/such/dir/x") + R"("})");
  assert(response.status == 500);
  assert(response.body.find("staged chunks were removed: ") == 0);
}

void TestVerifiedCompletionWaitsForEveryChunk() {
  TempDir      dir("handler_verify");
  UploadConfig config   = MakeConfig(dir);
  config.verifyComplete = true;
  UploadHandler handler(config);

  assert(PostChunk(handler, ChunkBody("v", 0, 2, 2, "x", "a")).status == 200);
  const std::string destination = dir.str("v.bin");
  const std::string json = R"({"uploadId":"v","filename":")" + destination + R"(","totalChunks":2})";

  Response early = PostCompletion(handler, json);
  assert(early.status == 500);
  assert(early.body.find("staged chunks were removed") == std::string::npos);
  assert(!std::filesystem::exists(destination));

  assert(PostChunk(handler, ChunkBody("v", 1, 2, 2, "x", "b")).status == 200);
  assert(PostCompletion(handler, json).status == 200);
  assert(ReadFile(destination) == "ab");
}

} // namespace

int main() {
  TestFullUploadThroughHandlers();
  TestOutOfOrderPartsAreServerErrors();
  TestNonMultipartChunkIsServerError();
  TestMissingBodyIsBadRequest();
  TestMalformedCompletionRequests();
  TestCompletionRequestParsing();
  TestUnknownUploadIsServerError();
  TestLostStagingIsFlagged();
  TestVerifiedCompletionWaitsForEveryChunk();

  std::cout << "chunkstash_unit_upload_handler: pass\n";
  return 0;
}
