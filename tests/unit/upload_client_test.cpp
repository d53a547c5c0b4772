#include "client/UploadClient.hpp"

#include <cassert>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using chunkstash::client::generateUploadId;
using chunkstash::client::planChunks;

void TestPlanSplitsIntoZeroBasedChunks() {
  auto plan = planChunks(13, 7);
  assert(plan.size() == 2);
  assert(plan[0].number == 0 && plan[0].offset == 0 && plan[0].length == 7);
  assert(plan[1].number == 1 && plan[1].offset == 7 && plan[1].length == 6);
}

void TestPlanExactMultiple() {
  auto plan = planChunks(20, 5);
  assert(plan.size() == 4);
  assert(plan.back().number == 3);
  assert(plan.back().offset == 15 && plan.back().length == 5);
}

void TestEmptyFileGetsOneEmptyChunk() {
  auto plan = planChunks(0, 1024);
  assert(plan.size() == 1);
  assert(plan[0].number == 0 && plan[0].length == 0);
}

void TestPlanRejectsBadSizes() {
  bool threw = false;
  try {
    planChunks(10, 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    planChunks(1ULL << 40, 1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "chunk numbers have to fit in 32 bits");
}

void TestUploadIdsAreRandomHex() {
  const std::string a = generateUploadId();
  const std::string b = generateUploadId();
  assert(a.size() == 32);
  assert(a != b);
  for (char c : a) {
    assert(std::isxdigit(static_cast<unsigned char>(c)));
  }
}

} // namespace

int main() {
  TestPlanSplitsIntoZeroBasedChunks();
  TestPlanExactMultiple();
  TestEmptyFileGetsOneEmptyChunk();
  TestPlanRejectsBadSizes();
  TestUploadIdsAreRandomHex();

  std::cout << "chunkstash_unit_upload_client: pass\n";
  return 0;
}
