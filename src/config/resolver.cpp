#include <sitecfg/resolver.hpp>
#include <sitecfg/defaults.hpp>
#include <sitecfg/log.hpp>
#include <sitecfg/merge.hpp>
#include <sitecfg/normalize.hpp>
#include <sitecfg/validate.hpp>

namespace sitecfg {

namespace fs = std::filesystem;

std::vector<std::string> unsupported_config_files() {
    fs::path base = fs::path(CONFIG_FILE).stem();
    std::vector<std::string> names;
    for (const char* ext : {".json", ".yaml", ".yml", ".ini"}) {
        names.push_back(base.string() + ext);
    }
    return names;
}

const char* state_name(ResolveState state) {
    switch (state) {
        case ResolveState::DirectOverride: return "direct-override";
        case ResolveState::FileDiscovery:  return "file-discovery";
        case ResolveState::NoFileFallback: return "no-file-fallback";
        case ResolveState::Resolved:       return "resolved";
        case ResolveState::Failed:         return "failed";
    }
    return "unknown";
}

static SiteError with_file(SiteError err, const fs::path& path) {
    if (err.file.empty()) err.file = path.string();
    return err;
}

// ---------------------------------------------------------------------------
// ConfigResolver
// ---------------------------------------------------------------------------

ConfigResolver::ConfigResolver(const FileLocator& locator,
                               const ModuleLoader& loader,
                               OnceNotifier& experimental_notice,
                               const Value& defaults)
    : locator_(locator), loader_(loader),
      experimental_notice_(experimental_notice), defaults_(defaults) {}

Result<SiteConfig> ConfigResolver::resolve(const std::string& phase,
                                           const fs::path& dir,
                                           const std::optional<Value>& override_config) const {
    ResolveOutcome outcome = run(phase, dir, override_config);
    if (outcome.config) {
        return Result<SiteConfig>::ok(std::move(*outcome.config));
    }
    return std::move(*outcome.error);
}

ResolveOutcome ConfigResolver::run(const std::string& phase,
                                   const fs::path& dir,
                                   const std::optional<Value>& override_config) const {
    ResolveState state = ResolveState::FileDiscovery;

    auto resolved = [&]() -> Result<SiteConfig> {
        if (override_config && !override_config->is_null()) {
            state = ResolveState::DirectOverride;
            log::debug("resolve: %s", state_name(state));
            return resolve_override(*override_config);
        }

        log::debug("resolve: %s from %s", state_name(state), dir.string().c_str());
        if (auto path = locator_.find_up(dir, {CONFIG_FILE})) {
            return resolve_file(phase, *path);
        }

        state = ResolveState::NoFileFallback;
        log::debug("resolve: %s", state_name(state));
        return resolve_without_file(dir);
    }();

    ResolveOutcome outcome;
    if (resolved.is_ok()) {
        outcome.state = ResolveState::Resolved;
        outcome.config = std::move(resolved).value();
    } else {
        outcome.state = ResolveState::Failed;
        outcome.error = std::move(resolved).error();
    }
    log::debug("resolve: %s -> %s", state_name(state), state_name(outcome.state));
    return outcome;
}

Result<SiteConfig> ConfigResolver::resolve_override(const Value& override_config) const {
    if (!override_config.is_table()) {
        return SiteError{SiteError::TypeMismatch,
            std::string("configuration override should be a table, received ") +
            override_config.type_name()};
    }
    Table origin{{"configOrigin", SERVER_ORIGIN}};
    return assign_defaults(override_config.as_table(), origin);
}

Result<SiteConfig> ConfigResolver::resolve_file(const std::string& phase,
                                                const fs::path& path) const {
    std::error_code ec;
    fs::path config_file = path.is_absolute() ? path : fs::absolute(path, ec);
    if (ec) {
        return SiteError{SiteError::IO,
            "cannot resolve path: " + path.string()}.in_file(path.string());
    }
    log::debug("loading %s", config_file.string().c_str());

    auto raw = loader_.load(config_file);
    if (raw.is_err()) return with_file(std::move(raw).error(), config_file);

    auto normalized = normalize_config(phase, raw.value(), defaults_);
    if (normalized.is_err()) return with_file(std::move(normalized).error(), config_file);

    const Value& user = normalized.value();
    if (!user.is_table()) {
        return with_file(SiteError{SiteError::TypeMismatch,
            std::string("configuration exported by ") + CONFIG_FILE +
            " should be a table, received " + user.type_name()}, config_file);
    }

    if (user.as_table().empty()) {
        log::warn("Detected %s, no exported configuration found.", CONFIG_FILE);
    }

    Table origin{
        {"configOrigin", CONFIG_FILE},
        {"configFile", config_file.string()},
    };
    auto result = assign_defaults(user.as_table(), origin);
    if (result.is_err()) return with_file(std::move(result).error(), config_file);
    return result;
}

Result<SiteConfig> ConfigResolver::resolve_without_file(const fs::path& dir) const {
    if (auto other = locator_.find_up(dir, unsupported_config_files())) {
        std::string name = other->filename().string();
        return SiteError{SiteError::UnsupportedSource,
            "Configuring via '" + name + "' is not supported. "
            "Please replace the file with '" + CONFIG_FILE + "'.",
            std::string("convert the settings to TOML and rename the file to ") + CONFIG_FILE}
            .in_file(other->string());
    }

    if (!defaults_.is_table()) {
        return SiteError{SiteError::InvalidArg, "default configuration is not a table"};
    }
    return SiteConfig::from_table(defaults_.as_table());
}

Result<SiteConfig> ConfigResolver::assign_defaults(const Table& user,
                                                   const Table& origin) const {
    if (!defaults_.is_table()) {
        return SiteError{SiteError::InvalidArg, "default configuration is not a table"};
    }

    auto checked = check_user_config(user);
    if (checked.is_err()) return std::move(checked).error();

    // The user's own keys win over the origin tags
    Table tagged = origin;
    for (const auto& [key, value] : checked.value()) {
        tagged.set(key, value);
    }

    Table merged = merge_config(tagged, defaults_.as_table(), &experimental_notice_);
    SITECFG_TRY(validate_config(merged));
    return SiteConfig::from_table(merged);
}

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

Result<SiteConfig> load_config(const std::string& phase,
                               const fs::path& dir,
                               OnceNotifier& experimental_notice,
                               const std::optional<Value>& override_config) {
    FilesystemLocator locator;
    TomlModuleLoader loader;
    ConfigResolver resolver(locator, loader, experimental_notice, default_config());
    return resolver.resolve(phase, dir, override_config);
}

} // namespace sitecfg
