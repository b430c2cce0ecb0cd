#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace vectorlink::fs {

struct FileInfo {
    std::string path;   // Path as passed to stat() ("/home/me/.anki_vector/sdk_config.ini")
    bool        isDirectory{false};
    std::uint64_t sizeBytes{0};

    // Optional; can be left as a default-constructed time_point if not available.
    std::chrono::system_clock::time_point modifiedTime{};
};

// Simple file abstraction; streaming open file handle.
class IFile {
public:
    virtual ~IFile() = default;

    // Read up to maxBytes into dst, returns number of bytes actually read (0 on EOF or error).
    virtual std::size_t read(void* dst, std::size_t maxBytes) = 0;

    // Write up to bytes from src, returns number of bytes actually written.
    virtual std::size_t write(const void* src, std::size_t bytes) = 0;

    // Flush buffered data to underlying storage if applicable.
    virtual bool flush() = 0;
};

// Abstract filesystem mounted at some root.
// All paths are POSIX-style within this FS ("/", "/dir/file", etc.).
class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    // Stable identifier used in log messages, e.g. "host", "memory".
    virtual std::string name() const = 0;

    // Basic file / directory queries.
    virtual bool exists(const std::string& path) = 0;
    virtual bool isDirectory(const std::string& path) = 0;

    // Creates a single directory level; succeeds if it already exists.
    virtual bool createDirectory(const std::string& path) = 0;
    virtual bool removeFile(const std::string& path) = 0;

    // Replaces `to` if it already exists.
    virtual bool rename(const std::string& from, const std::string& to) = 0;

    // Open a file using C stdio-style mode strings ("rb", "wb").
    // Returns nullptr on failure.
    virtual std::unique_ptr<IFile> open(
        const std::string& path,
        const char* mode
    ) = 0;

    // Query metadata for a single path.
    // Returns false if path does not exist or on error.
    virtual bool stat(
        const std::string& path,
        FileInfo& outInfo
    ) = 0;
};

} // namespace vectorlink::fs
