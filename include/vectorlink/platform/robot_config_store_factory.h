#pragma once

#include <memory>
#include <string>

#include "vectorlink/config/robot_config_ini_store.h"
#include "vectorlink/fs/filesystem.h"

namespace vectorlink::platform {

// "<user profile>/.anki_vector/sdk_config.ini"
std::string default_robot_config_path();

// Stdio filesystem over the whole host ("/"), for use with absolute paths.
std::unique_ptr<fs::IFileSystem> create_host_filesystem();

// Store at default_robot_config_path() on `host`.
// Throws ConfigurationIoError if the user profile directory is unknown.
std::unique_ptr<config::RobotConfigStore>
create_default_robot_config_store(fs::IFileSystem& host,
                                  config::StoreOptions options = {});

} // namespace vectorlink::platform
