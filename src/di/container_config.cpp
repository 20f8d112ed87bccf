#include "butterfly/di/container_config.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace butterfly::di {

void ContainerConfig::from_ptree(const boost::property_tree::ptree& pt) {
    if (auto policy_str =
            get_optional_value<std::string>(pt, "default_replace_policy")) {
        default_replace_policy = policy_from_string(*policy_str);
    }
    eager_singletons = get_value(pt, "eager_singletons", eager_singletons);
    trace_resolution = get_value(pt, "trace_resolution", trace_resolution);
}

void ContainerConfig::validate() const {
    if (default_replace_policy != ReplacePolicy::IMMEDIATE &&
        default_replace_policy != ReplacePolicy::DEFERRED) {
        throw std::invalid_argument(
            "Invalid replace policy value: " +
            std::to_string(static_cast<int>(default_replace_policy)));
    }
}

ReplacePolicy ContainerConfig::policy_from_string(
    const std::string& policy_str) {
    std::string lower = policy_str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "immediate") return ReplacePolicy::IMMEDIATE;
    if (lower == "deferred") return ReplacePolicy::DEFERRED;

    throw std::invalid_argument("Invalid replace policy: " + policy_str);
}

std::string ContainerConfig::policy_to_string(ReplacePolicy policy) {
    switch (policy) {
        case ReplacePolicy::IMMEDIATE:
            return "immediate";
        case ReplacePolicy::DEFERRED:
            return "deferred";
        default:
            return "unknown";
    }
}

}  // namespace butterfly::di
