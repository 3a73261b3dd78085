#include "release_name.h"
#include <algorithm>
#include <cctype>

namespace {

constexpr size_t kShortIdLength = 8;

} // namespace

std::string releaseName(const std::string& workload_id, const std::string& component_name) {
    std::string name = workload_id + "-" + component_name;

    if (name.size() > kMaxReleaseNameLength) {
        std::string short_id = workload_id.substr(0, kShortIdLength);
        size_t max_component_length = kMaxReleaseNameLength - short_id.size() - 1;

        std::string component = component_name;
        if (component.size() > max_component_length) {
            component = component.substr(component.size() - max_component_length);
        }
        name = short_id + "-" + component;
    }

    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return c == '_' ? '-' : static_cast<char>(std::tolower(c));
    });

    return name;
}
