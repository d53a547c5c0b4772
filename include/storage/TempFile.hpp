#pragma once

#include <fstream>
#include <string>

namespace chunkstash {
namespace storage {

// Scratch file in the system temp directory, removed on destruction.
class TempFile {
public:
    // Throws std::runtime_error if no file could be created
    explicit TempFile(const std::string& prefix);
    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::fstream& stream() { return stream_; }
    const std::string& path() const { return path_; }

    // Copies the whole content into out
    void copyTo(std::ostream& out);

private:
    std::string path_;
    std::fstream stream_;

    // Generates a unique filename to prevent collisions
    static std::string generateUniqueFilename(const std::string& prefix);
};

} // namespace storage
} // namespace chunkstash
