#pragma once

#include <stdexcept>
#include <string>

namespace chunkstash {
namespace upload {

/*
  Error types raised by the chunk upload core.

  The HTTP layer turns every one of them into a 500 response carrying
  what().
*/

class UploadError : public std::runtime_error {
public:
    explicit UploadError(const std::string& msg) : std::runtime_error(msg) {}
};

// Failure while decoding a chunk request. field() names the part being read.
class DecodeError : public UploadError {
public:
    DecodeError(const std::string& field, const std::string& msg)
        : UploadError(msg), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// A part arrived under another name than the one expected at this step
class FieldNameMismatch : public DecodeError {
public:
    FieldNameMismatch(const std::string& expected, const std::string& actual)
        : DecodeError(expected,
                      "invalid form name for part. Expected " + expected + " got " + actual),
          expected_(expected), actual_(actual) {}

    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

class StoreError : public UploadError {
public:
    StoreError(const std::string& path, const std::string& msg)
        : UploadError(msg), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

enum class RebuildStage {
    VerifyComplete,
    ListChunks,
    CreateAccumulator,
    AppendChunk,
    Cleanup,
    WriteDestination,
};

const char* to_string(RebuildStage stage);

/*
  Failure while reassembling an upload.

  stagingPreserved() is false when the staged chunks may already have been
  removed, i.e. the upload cannot be completed again.
*/
class RebuildError : public UploadError {
public:
    RebuildError(RebuildStage stage, bool stagingPreserved, const std::string& msg)
        : UploadError(msg), stage_(stage), stagingPreserved_(stagingPreserved) {}

    RebuildStage stage() const { return stage_; }
    bool stagingPreserved() const { return stagingPreserved_; }

private:
    RebuildStage stage_;
    bool stagingPreserved_;
};

} // namespace upload
} // namespace chunkstash
