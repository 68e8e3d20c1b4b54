#pragma once

#include <sitecfg/value.hpp>
#include <string>

namespace sitecfg {

// Environment-derived seeds for the default configuration
struct EnvDefaults {
    int cpus = 1;                 // worker count for experimental.cpus
    std::string analytics_id;     // empty when unset

    // Reads SITECFG_NODE_TOTAL and SITECFG_ANALYTICS_ID.
    // cpus = max(1, (node total, else hardware concurrency) - 1)
    static EnvDefaults from_process();

    // Same computation with explicit inputs; node_total <= 0 means unset
    static int worker_count(int node_total, unsigned hardware_threads);
};

// Build a default tree from explicit seeds
Value build_default_config(const EnvDefaults& env);

// Process-wide default tree, seeded from the environment on first use
const Value& default_config();

} // namespace sitecfg
