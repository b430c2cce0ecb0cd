#include "vectorlink/fs/fs_stdio.h"
#include "vectorlink/core/logging.h"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <sys/stat.h>

namespace vectorlink::fs {

static constexpr const char* TAG = "fs";

// ----------------------
// StdioFile
// ----------------------
class StdioFile : public IFile {
public:
    explicit StdioFile(std::FILE* fp)
        : _fp(fp)
    {}

    ~StdioFile() override {
        if (_fp) {
            std::fclose(_fp);
        }
    }

    StdioFile(const StdioFile&) = delete;
    StdioFile& operator=(const StdioFile&) = delete;

    std::size_t read(void* dst, std::size_t maxBytes) override
    {
        if (!_fp || maxBytes == 0) return 0;
        return std::fread(dst, 1, maxBytes, _fp);
    }

    std::size_t write(const void* src, std::size_t bytes) override
    {
        if (!_fp || bytes == 0) return 0;
        return std::fwrite(src, 1, bytes, _fp);
    }

    bool flush() override
    {
        if (!_fp) return false;
        return std::fflush(_fp) == 0;
    }

private:
    std::FILE* _fp{};
};

// ----------------------
// StdioFileSystem
// ----------------------
class StdioFileSystem : public IFileSystem {
public:
    StdioFileSystem(std::string rootDir, std::string name)
        : _root(std::move(rootDir))
        , _name(std::move(name))
    {
        // normalise root: no trailing slash, "/" itself becomes empty
        while (!_root.empty() && _root.back() == '/') {
            _root.pop_back();
        }
    }

    std::string name() const override { return _name; }

    bool exists(const std::string& path) override
    {
        FileInfo info{};
        return stat(path, info);
    }

    bool isDirectory(const std::string& path) override
    {
        FileInfo info{};
        return stat(path, info) && info.isDirectory;
    }

    bool createDirectory(const std::string& path) override
    {
        const auto fp = fullPath(path);
        if (::mkdir(fp.c_str(), 0755) == 0) {
            return true;
        }
        const int e = errno;
        if (e == EEXIST && isDirectory(path)) {
            return true;
        }
        VL_LOGE(TAG, "mkdir failed: fs='%s' path='%s' errno=%d (%s)",
                name().c_str(), fp.c_str(), e, std::strerror(e));
        return false;
    }

    bool removeFile(const std::string& path) override
    {
        return std::remove(fullPath(path).c_str()) == 0;
    }

    bool rename(const std::string& from, const std::string& to) override
    {
        if (std::rename(fullPath(from).c_str(), fullPath(to).c_str()) == 0) {
            return true;
        }
        const int e = errno;
        VL_LOGE(TAG, "rename failed: fs='%s' from='%s' to='%s' errno=%d (%s)",
                name().c_str(), from.c_str(), to.c_str(), e, std::strerror(e));
        return false;
    }

    std::unique_ptr<IFile> open(const std::string& path,
                                const char* mode) override
    {
        const std::string full = fullPath(path);
        auto fp = std::fopen(full.c_str(), mode);

        if (!fp)
        {
            const int e = errno;
            VL_LOGE(TAG,
                    "open failed: fs='%s' mode='%s' path='%s' full='%s' errno=%d (%s)",
                    name().c_str(),
                    mode ? mode : "(null)",
                    path.c_str(),
                    full.c_str(),
                    e,
                    std::strerror(e));

            return nullptr;
        }

        return std::make_unique<StdioFile>(fp);
    }

    bool stat(const std::string& path, FileInfo& out) override
    {
        struct stat st{};
        if (::stat(fullPath(path).c_str(), &st) != 0) {
            return false;
        }

        out.path = path;
        out.isDirectory = S_ISDIR(st.st_mode);
        out.sizeBytes   = S_ISREG(st.st_mode)
                            ? static_cast<std::uint64_t>(st.st_size)
                            : 0;

        if (st.st_mtime != 0) {
            out.modifiedTime =
                std::chrono::system_clock::from_time_t(st.st_mtime);
        } else {
            out.modifiedTime = {};
        }

        return true;
    }

private:
    std::string fullPath(const std::string& rel) const
    {
        // rel is expected to be absolute within the FS ("/", "/foo", etc.)
        if (rel.empty() || rel == "/") {
            return _root.empty() ? std::string("/") : _root;
        }

        if (rel.front() == '/') {
            return _root + rel;
        }
        return _root + "/" + rel;
    }

    std::string _root;
    std::string _name;
};

// Factory
std::unique_ptr<IFileSystem>
create_stdio_filesystem(const std::string& rootDir,
                        const std::string& name)
{
    VL_LOGD(TAG, "Creating stdio filesystem '%s' at root '%s'",
            name.c_str(), rootDir.empty() ? "/" : rootDir.c_str());
    return std::make_unique<StdioFileSystem>(rootDir, name);
}

} // namespace vectorlink::fs
