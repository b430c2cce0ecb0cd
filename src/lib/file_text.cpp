#include "vectorlink/fs/file_text.h"
#include "vectorlink/core/logging.h"

#include <cstdint>
#include <vector>

namespace vectorlink::fs {

static constexpr const char* TAG = "fs";

std::string parent_path(std::string_view path)
{
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    const std::size_t slash = path.find_last_of('/');
    if (slash == std::string_view::npos) {
        return std::string();
    }
    if (slash == 0) {
        return "/";
    }
    return std::string(path.substr(0, slash));
}

std::string join_path(std::string_view dir, std::string_view name)
{
    if (dir.empty()) {
        return std::string(name);
    }
    std::string out(dir);
    if (out.back() != '/') {
        out.push_back('/');
    }
    out.append(name);
    return out;
}

bool read_text_file(IFileSystem& fs, const std::string& path, std::string& out)
{
    auto file = fs.open(path, "rb");
    if (!file) {
        return false;
    }

    out.clear();
    std::vector<std::uint8_t> buf(1024);
    for (;;) {
        const std::size_t n = file->read(buf.data(), buf.size());
        if (n == 0) {
            break;
        }
        out.append(reinterpret_cast<const char*>(buf.data()), n);
    }
    return true;
}

bool write_text_file(IFileSystem& fs, const std::string& path, std::string_view text)
{
    auto file = fs.open(path, "wb");
    if (!file) {
        return false;
    }

    const char* ptr = text.data();
    std::size_t remaining = text.size();

    while (remaining > 0) {
        const std::size_t written = file->write(ptr, remaining);
        if (written == 0) {
            VL_LOGE(TAG, "short write to '%s' on '%s' (%zu bytes left)",
                    path.c_str(), fs.name().c_str(), remaining);
            return false;
        }
        remaining -= written;
        ptr       += written;
    }
    return file->flush();
}

bool create_directories(IFileSystem& fs, const std::string& path)
{
    if (path.empty() || fs.isDirectory(path)) {
        return true;
    }

    const std::string parent = parent_path(path);
    if (!parent.empty() && parent != path && !create_directories(fs, parent)) {
        return false;
    }
    return fs.createDirectory(path);
}

} // namespace vectorlink::fs
