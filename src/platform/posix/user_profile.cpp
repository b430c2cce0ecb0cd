#include "vectorlink/platform/user_profile.h"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace vectorlink::platform {

std::string user_profile_directory()
{
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return home;
    }

    const struct passwd* pw = ::getpwuid(::getuid());
    if (pw && pw->pw_dir && *pw->pw_dir) {
        return pw->pw_dir;
    }
    return std::string();
}

} // namespace vectorlink::platform
