#pragma once

#include <sitecfg/result.hpp>
#include <sitecfg/value.hpp>
#include <filesystem>
#include <string>

namespace sitecfg {

// Produces the raw exported value of a configuration file: a table, or a
// callable taking (phase, { defaultConfig })
class ModuleLoader {
public:
    virtual ~ModuleLoader() = default;
    virtual Result<Value> load(const std::filesystem::path& path) const = 0;
};

// Reads TOML configuration files
class TomlModuleLoader : public ModuleLoader {
public:
    Result<Value> load(const std::filesystem::path& path) const override;
};

// Parse TOML text into a table value. Dates and times become their TOML text.
Result<Value> parse_toml_config(const std::string& toml_str);

} // namespace sitecfg
