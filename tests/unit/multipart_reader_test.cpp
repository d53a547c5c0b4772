#include "http/MultipartReader.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace {

using chunkstash::http::MultipartError;
using chunkstash::http::MultipartReader;
using chunkstash::http::PartStream;
using chunkstash::testing::BuildMultipart;

void TestReadsPartsInWireOrder() {
  std::istringstream body(BuildMultipart({{"first", "one", ""}, {"second", "two", ""}, {"file", "payload", "a.bin"}},
                                         "XYZ"));
  MultipartReader reader(body, "XYZ");

  auto part = reader.nextPart();
  assert(part && part->name == "first" && !part->isFile());
  assert(reader.readAll(1024) == "one");

  part = reader.nextPart();
  assert(part && part->name == "second");
  assert(reader.readAll(1024) == "two");

  part = reader.nextPart();
  assert(part && part->name == "file");
  assert(part->filename == "a.bin");
  assert(part->content_type == "application/octet-stream");
  assert(reader.readAll(1024) == "payload");

  assert(!reader.nextPart());
  assert(!reader.nextPart());
}

void TestUnreadPartIsSkipped() {
  std::istringstream body(BuildMultipart({{"skipped", std::string(50000, 'x'), ""}, {"kept", "value", ""}}, "XYZ"));
  MultipartReader reader(body, "XYZ");

  auto part = reader.nextPart();
  assert(part && part->name == "skipped");
  char buf[10];
  assert(reader.read(buf, sizeof(buf)) == sizeof(buf));

  part = reader.nextPart();
  assert(part && part->name == "kept");
  assert(reader.readAll(1024) == "value");
}

void TestBoundaryLookalikesStayInBody() {
  const std::string payload = "line1\r\n--XY\r\na--XYZ\r\n-XYZ--\r\nline2\r\n";
  std::istringstream body("preamble to ignore\r\n" + BuildMultipart({{"data", payload, "d.bin"}}, "XYZ"));
  MultipartReader reader(body, "XYZ");

  auto part = reader.nextPart();
  assert(part && part->name == "data");
  assert(reader.readAll(1024) == payload);
  assert(!reader.nextPart());
}

void TestDelimiterSplitAcrossReads() {
  // Sizes around the internal read block so the delimiter straddles a refill
  for (std::size_t size = 16 * 1024 - 80; size <= 16 * 1024 + 8; size += 11) {
    std::string payload(size, 'p');
    payload.back() = '\r';
    std::istringstream body(BuildMultipart({{"data", payload, "d.bin"}, {"tail", "t", ""}}, "XYZ"));
    MultipartReader reader(body, "XYZ");

    assert(reader.nextPart());
    assert(reader.readAll(size) == payload);
    auto tail = reader.nextPart();
    assert(tail && tail->name == "tail");
    assert(reader.readAll(16) == "t");
  }
}

void TestPartStreamReadsCurrentPart() {
  std::istringstream body(BuildMultipart({{"meta", "m", ""}, {"data", "streamed bytes", "blob"}}, "XYZ"));
  auto reader = std::make_shared<MultipartReader>(body, "XYZ");

  assert(reader->nextPart());
  assert(reader->readAll(16) == "m");
  assert(reader->nextPart());

  PartStream stream(reader);
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  assert(content == "streamed bytes");
}

void TestMissingClosingBoundaryFails() {
  std::istringstream body(BuildMultipart({{"data", "truncated", ""}}, "XYZ", false).substr(0, 60));
  MultipartReader reader(body, "XYZ");

  bool threw = false;
  try {
    reader.nextPart();
    reader.readAll(1024);
  } catch (const MultipartError&) {
    threw = true;
  }
  assert(threw && "A body cut off inside a part must fail.");
}

void TestBodyWithoutBoundaryFails() {
  std::istringstream body("no multipart content here");
  MultipartReader reader(body, "XYZ");

  bool threw = false;
  try {
    reader.nextPart();
  } catch (const MultipartError&) {
    threw = true;
  }
  assert(threw);
}

void TestOversizedFieldIsRejected() {
  std::istringstream body(BuildMultipart({{"big", std::string(100, 'b'), ""}}, "XYZ"));
  MultipartReader reader(body, "XYZ");
  assert(reader.nextPart());

  bool threw = false;
  try {
    reader.readAll(99);
  } catch (const MultipartError&) {
    threw = true;
  }
  assert(threw);
}

void TestNameRequiresFormDataDisposition() {
  std::istringstream body("--XYZ\r\nContent-Disposition: attachment; name=\"x\"\r\n\r\nv\r\n--XYZ--\r\n");
  MultipartReader reader(body, "XYZ");
  auto part = reader.nextPart();
  assert(part && part->name.empty());
}

void TestContentTypeHelpers() {
  assert(MultipartReader::extractBoundary("multipart/form-data; boundary=abc") == "abc");
  assert(MultipartReader::extractBoundary("multipart/form-data; charset=utf-8; Boundary=\"q b\"") == "q b");
  assert(MultipartReader::extractBoundary("multipart/form-data").empty());
  assert(MultipartReader::mediaType(" Multipart/Form-Data ; boundary=abc") == "multipart/form-data");
}

} // namespace

int main() {
  TestReadsPartsInWireOrder();
  TestUnreadPartIsSkipped();
  TestBoundaryLookalikesStayInBody();
  TestDelimiterSplitAcrossReads();
  TestPartStreamReadsCurrentPart();
  TestMissingClosingBoundaryFails();
  TestBodyWithoutBoundaryFails();
  TestOversizedFieldIsRejected();
  TestNameRequiresFormDataDisposition();
  TestContentTypeHelpers();

  std::cout << "chunkstash_unit_multipart_reader: pass\n";
  return 0;
}
