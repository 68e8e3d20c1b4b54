#pragma once

#include <sitecfg/result.hpp>
#include <sitecfg/value.hpp>
#include <sitecfg/site_config.hpp>
#include <sitecfg/locate.hpp>
#include <sitecfg/loader.hpp>
#include <sitecfg/notice.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sitecfg {

// Conventional configuration file name
inline constexpr const char* CONFIG_FILE = "site.config.toml";

// configOrigin of a direct override
inline constexpr const char* SERVER_ORIGIN = "server";

// Same base name with extensions that are recognized but not loadable.
// Finding one of these instead of CONFIG_FILE is an error.
std::vector<std::string> unsupported_config_files();

enum class ResolveState {
    DirectOverride,
    FileDiscovery,
    NoFileFallback,
    Resolved,
    Failed
};

const char* state_name(ResolveState state);

struct ResolveOutcome {
    ResolveState state = ResolveState::Failed;
    // Set in the Resolved state
    std::optional<SiteConfig> config;
    // Set in the Failed state
    std::optional<SiteError> error;
};

// Produces the effective configuration for one build phase.
//
// Each call is independent. The only state shared between calls is the
// experimental-features notifier, which belongs to the caller.
class ConfigResolver {
public:
    ConfigResolver(const FileLocator& locator,
                   const ModuleLoader& loader,
                   OnceNotifier& experimental_notice,
                   const Value& defaults);

    // Direct override when `override_config` is set and not null; otherwise
    // discover CONFIG_FILE upward from `dir`.
    Result<SiteConfig> resolve(const std::string& phase,
                               const std::filesystem::path& dir,
                               const std::optional<Value>& override_config = std::nullopt) const;

    // Same, reporting the terminal state alongside the result
    ResolveOutcome run(const std::string& phase,
                       const std::filesystem::path& dir,
                       const std::optional<Value>& override_config = std::nullopt) const;

private:
    const FileLocator& locator_;
    const ModuleLoader& loader_;
    OnceNotifier& experimental_notice_;
    const Value& defaults_;

    Result<SiteConfig> resolve_override(const Value& override_config) const;
    Result<SiteConfig> resolve_file(const std::string& phase,
                                    const std::filesystem::path& path) const;
    Result<SiteConfig> resolve_without_file(const std::filesystem::path& dir) const;

    // Pre-merge checks, origin tagging, merge, validator chain
    Result<SiteConfig> assign_defaults(const Table& user, const Table& origin) const;
};

// Resolve against the real filesystem with the TOML loader and the
// process-wide default configuration
Result<SiteConfig> load_config(const std::string& phase,
                               const std::filesystem::path& dir,
                               OnceNotifier& experimental_notice,
                               const std::optional<Value>& override_config = std::nullopt);

} // namespace sitecfg
