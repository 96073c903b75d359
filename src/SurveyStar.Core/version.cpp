#include "version.h"
#include "string_util.h"

#include <fmt/format.h>

#include <set>

namespace sstar::core {

int Version::major() { return API_MAJOR; }

int Version::minor() { return API_MINOR; }

int Version::patch() { return API_PATCH; }

std::string Version::to_string() {
    static const auto version = fmt::format("{}.{}.{}", API_MAJOR, API_MINOR, API_PATCH);
    return version;
}

bool Version::is_at_least(int major, int minor, int patch) {
    if (API_MAJOR != major) {
        return API_MAJOR > major;
    }

    if (API_MINOR != minor) {
        return API_MINOR > minor;
    }

    return API_PATCH >= patch;
}

bool Version::has_feature(const std::string &name) {
    static const auto features = std::set<std::string>{
        "CODEBOOK_RECONCILE", "QUANTILE_BUCKETS", "THREADSAFE", "VERIFICATION"};

    return features.contains(to_upper(name));
}

} // namespace sstar::core
