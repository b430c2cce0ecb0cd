#pragma once

#include <string>

namespace vectorlink::platform {

// Home directory of the current user: $HOME, else the passwd entry.
// Returns an empty string when neither is available.
std::string user_profile_directory();

} // namespace vectorlink::platform
