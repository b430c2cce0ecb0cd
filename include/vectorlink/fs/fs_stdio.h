#pragma once

#include <memory>
#include <string>

#include "vectorlink/fs/filesystem.h"

namespace vectorlink::fs {

// Generic stdio-backed filesystem rooted at rootDir ("/" for the whole host).
std::unique_ptr<IFileSystem>
create_stdio_filesystem(const std::string& rootDir,
                        const std::string& name);

} // namespace vectorlink::fs
