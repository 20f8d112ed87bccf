#pragma once

#include <ostream>
#include <string>

#include "butterfly/config/config.hpp"

namespace butterfly::di {

/**
 * @brief How replace() cuts over to the new chain
 */
enum class ReplacePolicy {
    IMMEDIATE,  // Dispose the cached instance now; next resolve rebuilds
    DEFERRED    // Keep serving the old instance until refresh()
};

inline std::ostream& operator<<(std::ostream& os, ReplacePolicy policy) {
    switch (policy) {
        case ReplacePolicy::IMMEDIATE:
            return os << "immediate";
        case ReplacePolicy::DEFERRED:
            return os << "deferred";
        default:
            return os << "unknown";
    }
}

// Settings of the "container" section
class ContainerConfig
    : public config::ReloadableConfigurationProperties<ContainerConfig> {
public:
    ReplacePolicy default_replace_policy = ReplacePolicy::IMMEDIATE;
    // preinstantiate() builds every singleton, not only the eager ones
    bool eager_singletons = false;
    // Log every resolution at trace level
    bool trace_resolution = false;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "container"; }

    static ReplacePolicy policy_from_string(const std::string& policy_str);
    static std::string policy_to_string(ReplacePolicy policy);
};

}  // namespace butterfly::di
