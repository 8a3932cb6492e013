#pragma once

namespace ghostmeter {

/// Version information
struct Version {
    static constexpr int MAJOR = GM_VERSION_MAJOR;
    static constexpr int MINOR = GM_VERSION_MINOR;
    static constexpr int PATCH = GM_VERSION_PATCH;
    
    static const char* get_version_string();
};

} // namespace ghostmeter
