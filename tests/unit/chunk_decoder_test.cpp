#include "upload/ChunkDecoder.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

namespace {

using chunkstash::config::UploadConfig;
using chunkstash::testing::BuildMultipart;
using chunkstash::testing::ChunkBody;
using chunkstash::testing::FormPart;
using chunkstash::testing::MultipartContentType;
using chunkstash::upload::ChunkDecoder;
using chunkstash::upload::ChunkDescriptor;
using chunkstash::upload::DecodeError;
using chunkstash::upload::FieldNameMismatch;

UploadConfig MakeConfig() {
  UploadConfig config;
  config.chunkRoot = "/srv/chunks";
  return config;
}

std::string ReadPayload(ChunkDescriptor& chunk) {
  return std::string(std::istreambuf_iterator<char>(*chunk.data), std::istreambuf_iterator<char>());
}

// Decodes a body expected to fail and returns the error
DecodeError DecodeFailure(const std::string& body, const std::string& content_type = MultipartContentType()) {
  ChunkDecoder       decoder(MakeConfig());
  std::istringstream stream(body);
  try {
    decoder.decode(stream, content_type);
  } catch (const DecodeError& e) {
    return e;
  }
  assert(false && "decode was expected to fail");
  return DecodeError("", "");
}

void TestDecodesAllFieldsInOrder() {
  ChunkDecoder       decoder(MakeConfig());
  std::istringstream body(ChunkBody("abc123", 1, 2, 13, "greeting.txt", "World!"));

  ChunkDescriptor chunk = decoder.decode(body, MultipartContentType());
  assert(chunk.uploadId == "abc123");
  assert(chunk.chunkNumber == 1);
  assert(chunk.totalChunks == 2);
  assert(chunk.totalFileSize == 13);
  assert(chunk.filename == "greeting.txt");
  assert(chunk.uploadDir == "/srv/chunks/abc123");
  assert(chunk.data != nullptr);
  assert(ReadPayload(chunk) == "World!");
}

void TestPayloadStaysUnreadUntilConsumed() {
  ChunkDecoder       decoder(MakeConfig());
  const std::string  payload(200000, '\x7f');
  std::istringstream body(ChunkBody("big", 0, 1, 200000, "big.bin", payload));

  ChunkDescriptor chunk = decoder.decode(body, MultipartContentType());
  // Most of the request body is still in the source stream
  assert(body.tellg() < static_cast<std::streamoff>(payload.size() / 2));
  assert(ReadPayload(chunk) == payload);
}

void TestLargeIntegersAndRawFilename() {
  ChunkDecoder       decoder(MakeConfig());
  std::istringstream body(ChunkBody("id", -1, 2147483647, 1099511627776LL, "../dir/name with spaces.bin", ""));

  ChunkDescriptor chunk = decoder.decode(body, MultipartContentType());
  assert(chunk.chunkNumber == -1);
  assert(chunk.totalChunks == 2147483647);
  assert(chunk.totalFileSize == 1099511627776LL);
  assert(chunk.filename == "../dir/name with spaces.bin");
  assert(ReadPayload(chunk).empty());
}

void TestOutOfOrderPartsReportExpectedAndActual() {
  const std::string body = BuildMultipart({{"chunk_number", "0", ""},
                                           {"upload_id", "abc", ""},
                                           {"total_chunks", "1", ""},
                                           {"total_file_size", "1", ""},
                                           {"file_name", "f", ""},
                                           {"chunk", "x", "blob"}},
                                          "chunkstash-boundary");
  ChunkDecoder       decoder(MakeConfig());
  std::istringstream stream(body);

  bool threw = false;
  try {
    decoder.decode(stream, MultipartContentType());
  } catch (const FieldNameMismatch& e) {
    threw = true;
    assert(e.expected() == "upload_id");
    assert(e.actual() == "chunk_number");
    assert(e.field() == "upload_id");
    assert(std::string(e.what()).find("Expected upload_id got chunk_number") != std::string::npos);
  }
  assert(threw);
}

void TestSwappedScalarFieldsFail() {
  const std::string body = BuildMultipart({{"upload_id", "abc", ""},
                                           {"chunk_number", "0", ""},
                                           {"total_file_size", "1", ""},
                                           {"total_chunks", "1", ""},
                                           {"file_name", "f", ""},
                                           {"chunk", "x", "blob"}},
                                          "chunkstash-boundary");
  ChunkDecoder       decoder(MakeConfig());
  std::istringstream stream(body);

  bool threw = false;
  try {
    decoder.decode(stream, MultipartContentType());
  } catch (const FieldNameMismatch& e) {
    threw = true;
    assert(e.expected() == "total_chunks");
    assert(e.actual() == "total_file_size");
  }
  assert(threw);
}

void TestIntegerParseFailures() {
  auto with_field = [](const std::string& chunk_number, const std::string& total_chunks,
                       const std::string& total_file_size) {
    return BuildMultipart({{"upload_id", "abc", ""},
                           {"chunk_number", chunk_number, ""},
                           {"total_chunks", total_chunks, ""},
                           {"total_file_size", total_file_size, ""},
                           {"file_name", "f", ""},
                           {"chunk", "x", "blob"}},
                          "chunkstash-boundary");
  };

  assert(DecodeFailure(with_field("12abc", "1", "1")).field() == "chunk_number");
  assert(DecodeFailure(with_field("", "1", "1")).field() == "chunk_number");
  assert(DecodeFailure(with_field(" 1", "1", "1")).field() == "chunk_number");
  assert(DecodeFailure(with_field("2147483648", "1", "1")).field() == "chunk_number");
  assert(DecodeFailure(with_field("0", "one", "1")).field() == "total_chunks");
  assert(DecodeFailure(with_field("0", "1", "9223372036854775808")).field() == "total_file_size");
  assert(DecodeFailure(with_field("0", "1", "1.5")).field() == "total_file_size");
}

void TestMissingPayloadPartFails() {
  const std::string body = BuildMultipart({{"upload_id", "abc", ""},
                                           {"chunk_number", "0", ""},
                                           {"total_chunks", "1", ""},
                                           {"total_file_size", "1", ""},
                                           {"file_name", "f", ""}},
                                          "chunkstash-boundary");
  DecodeError error = DecodeFailure(body);
  assert(error.field() == "chunk");
}

void TestTruncatedBodyFails() {
  std::string body = ChunkBody("abc", 0, 1, 1, "f", "x");
  body.resize(body.find("total_chunks") + 20);

  DecodeError error = DecodeFailure(body);
  assert(error.field() == "total_chunks");
}

void TestRejectsNonMultipartRequests() {
  assert(std::string(DecodeFailure("{}", "application/json").what()).find("multipart/form-data") != std::string::npos);
  assert(std::string(DecodeFailure("", "multipart/form-data").what()).find("boundary") != std::string::npos);
}

void TestRejectsUploadIdsThatEscapeTheChunkRoot() {
  assert(DecodeFailure(ChunkBody("", 0, 1, 1, "f", "x")).field() == "upload_id");
  assert(DecodeFailure(ChunkBody("..", 0, 1, 1, "f", "x")).field() == "upload_id");
  assert(DecodeFailure(ChunkBody("a/b", 0, 1, 1, "f", "x")).field() == "upload_id");
}

} // namespace

int main() {
  TestDecodesAllFieldsInOrder();
  TestPayloadStaysUnreadUntilConsumed();
  TestLargeIntegersAndRawFilename();
  TestOutOfOrderPartsReportExpectedAndActual();
  TestSwappedScalarFieldsFail();
  TestIntegerParseFailures();
  TestMissingPayloadPartFails();
  TestTruncatedBodyFails();
  TestRejectsNonMultipartRequests();
  TestRejectsUploadIdsThatEscapeTheChunkRoot();

  std::cout << "chunkstash_unit_chunk_decoder: pass\n";
  return 0;
}
