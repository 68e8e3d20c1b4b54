#pragma once

#include <sitecfg/result.hpp>
#include <sitecfg/value.hpp>
#include <functional>
#include <string>
#include <vector>

namespace sitecfg {

// Allowed values of `target`
extern const std::vector<std::string> TARGETS;
// Allowed values of `experimental.reactMode`
extern const std::vector<std::string> REACT_MODES;

inline constexpr size_t MAX_IMAGE_DOMAINS = 50;
inline constexpr size_t MAX_IMAGE_SIZES = 25;
inline constexpr double MIN_IMAGE_SIZE = 1;
inline constexpr double MAX_IMAGE_SIZE = 10000;

// Output folder name reserved for static public files
inline constexpr const char* RESERVED_DIST_DIR = "public";

bool is_target_like_serverless(const std::string& target);

// ---------------------------------------------------------------------------
// Pre-merge checks on the raw user table
// ---------------------------------------------------------------------------

// Enforces the target and experimental.reactMode enumerations and strips one
// trailing slash from amp.canonicalBase. Returns the normalized copy.
Result<Table> check_user_config(const Table& user);

// ---------------------------------------------------------------------------
// Post-merge validator chain
// ---------------------------------------------------------------------------

struct ValidatorPass {
    const char* name;
    bool mutating;                          // rewrites fields instead of checking them
    std::function<Status(Table&)> run;
};

// The passes in the order validate_config() runs them
const std::vector<ValidatorPass>& validator_chain();

// Run every pass over a merged configuration; the first failure stops the
// chain and is returned
Status validate_config(Table& config);

Status check_dist_dir(const Table& config);
Status check_page_extensions(const Table& config);
Status check_asset_prefix(const Table& config);
Status check_base_path(const Table& config);

// Seed an empty assetPrefix and amp.canonicalBase from a non-empty basePath
void apply_base_path(Table& config);

Status check_images(const Table& config);
// Append a trailing slash to images.path
void normalize_image_path(Table& config);
Status check_image_domains(const Table& config);
// `field` is "deviceSizes" or "imageSizes"
Status check_image_sizes(const Table& config, const std::string& field);

Status check_i18n(const Table& config);
// Move i18n.defaultLocale to the front of i18n.locales
void reorder_locales(Table& config);

} // namespace sitecfg
