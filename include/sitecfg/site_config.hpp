#pragma once

#include <sitecfg/result.hpp>
#include <sitecfg/value.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sitecfg {

// [images]
struct ImagesConfig {
    std::vector<double> device_sizes;   // pixel widths, 1 to 10000
    std::vector<double> image_sizes;
    std::vector<std::string> domains;   // hosts allowed for remote images
    std::string path;
    std::string loader;
    Table extra;
};

// [devIndicators]
struct DevIndicatorsConfig {
    bool build_activity = true;
    bool auto_prerender = true;
    Table extra;
};

// [onDemandEntries]
struct OnDemandEntriesConfig {
    int64_t max_inactive_age = 60 * 1000;   // milliseconds
    int64_t pages_buffer_length = 2;
    Table extra;
};

// [amp]
struct AmpConfig {
    std::string canonical_base;
    Table extra;
};

// One entry of experimental.i18n.domains
struct DomainBinding {
    std::string domain;
    std::string default_locale;
    std::optional<std::vector<std::string>> locales;
    Table extra;
};

// [experimental.i18n]
struct I18nConfig {
    std::vector<std::string> locales;   // default locale first
    std::string default_locale;
    std::optional<std::vector<DomainBinding>> domains;
    std::optional<bool> locale_detection;
    Table extra;
};

// [experimental]
struct ExperimentalConfig {
    int64_t cpus = 1;
    bool modern = false;
    bool plugins = false;
    bool profiling = false;
    bool spr_flush_to_disk = true;
    std::string react_mode = "legacy";
    bool worker_threads = false;
    bool page_env = false;
    bool production_browser_source_maps = false;
    bool optimize_fonts = false;
    bool optimize_images = false;
    bool scroll_restoration = false;
    std::optional<I18nConfig> i18n;     // unset when i18n = false
    Table extra;
};

// [future]
struct FutureConfig {
    bool exclude_default_moment_locales = false;
    Table extra;
};

// The resolved configuration with a typed field for every known key.
// Unknown keys at each level are kept in `extra`.
struct SiteConfig {
    Table env;
    Value bundler;                  // null or function
    Value dev_middleware;           // null or function
    std::string dist_dir = ".site";
    std::string asset_prefix;
    std::string config_origin = "default";
    std::optional<std::string> config_file;
    bool use_file_system_public_routes = true;
    Value generate_build_id;        // function
    bool generate_etags = true;
    std::vector<std::string> page_extensions;
    std::string target = "server";
    bool powered_by_header = true;
    bool compress = true;
    std::string analytics_id;
    ImagesConfig images;
    DevIndicatorsConfig dev_indicators;
    OnDemandEntriesConfig on_demand_entries;
    AmpConfig amp;
    std::string base_path;
    Table sass_options;
    bool trailing_slash = false;
    ExperimentalConfig experimental;
    FutureConfig future;
    Table server_runtime_config;
    Table public_runtime_config;
    bool react_strict_mode = false;
    Table extra;

    // Read a merged configuration table. Absent keys keep the field
    // defaults above; a known key of the wrong type is a TypeMismatch.
    static Result<SiteConfig> from_table(const Table& table);

    // Inverse of from_table
    Table to_table() const;

    bool is_serverless() const;
};

} // namespace sitecfg
