#include "vectorlink/platform/robot_config_store_factory.h"
#include "vectorlink/platform/user_profile.h"
#include "vectorlink/config/config_errors.h"
#include "vectorlink/core/logging.h"
#include "vectorlink/fs/file_text.h"
#include "vectorlink/fs/fs_stdio.h"

namespace vectorlink::platform {

static constexpr const char* TAG = "config_factory";

static constexpr const char* CONFIG_DIR  = ".anki_vector";
static constexpr const char* CONFIG_FILE = "sdk_config.ini";

std::string default_robot_config_path()
{
    const std::string home = user_profile_directory();
    if (home.empty()) {
        return std::string();
    }
    return fs::join_path(fs::join_path(home, CONFIG_DIR), CONFIG_FILE);
}

std::unique_ptr<fs::IFileSystem> create_host_filesystem()
{
    return fs::create_stdio_filesystem("/", "host");
}

std::unique_ptr<config::RobotConfigStore>
create_default_robot_config_store(fs::IFileSystem& host, config::StoreOptions options)
{
    const std::string path = default_robot_config_path();
    if (path.empty()) {
        VL_LOGE(TAG, "Cannot determine the user profile directory");
        throw config::ConfigurationIoError("cannot determine the user profile directory");
    }

    VL_LOGD(TAG, "Robot configuration store at '%s'", path.c_str());
    return std::make_unique<config::IniRobotConfigStore>(host, path, options);
}

} // namespace vectorlink::platform
