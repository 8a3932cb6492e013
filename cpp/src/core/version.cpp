#include "ghostmeter/core/version.hpp"
#include <sstream>
#include <string>

namespace ghostmeter {

const char* Version::get_version_string() {
    static const std::string version = [] {
        std::ostringstream oss;
        oss << MAJOR << "." << MINOR << "." << PATCH;
        return oss.str();
    }();
    return version.c_str();
}

} // namespace ghostmeter
