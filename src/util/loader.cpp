#include <sitecfg/loader.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace sitecfg {

static Value from_node(const toml::node& node);

static Table from_table(const toml::table& tbl) {
    Table out;
    for (const auto& [key, val] : tbl) {
        out.set(std::string(key.str()), from_node(val));
    }
    return out;
}

static std::string stream_text(const toml::node& node) {
    std::ostringstream ss;
    node.visit([&ss](const auto& n) { ss << n; });
    return ss.str();
}

static Value from_node(const toml::node& node) {
    if (auto tbl = node.as_table()) {
        return Value(from_table(*tbl));
    }
    if (auto arr = node.as_array()) {
        Array out;
        for (const auto& elem : *arr) {
            out.push_back(from_node(elem));
        }
        return Value(std::move(out));
    }
    if (auto s = node.value<std::string>()) {
        return Value(std::string(*s));
    }
    if (node.is_boolean()) {
        return Value(*node.value<bool>());
    }
    if (node.is_integer()) {
        return Value(static_cast<long long>(*node.value<int64_t>()));
    }
    if (node.is_floating_point()) {
        return Value(*node.value<double>());
    }
    // date, time, date-time
    return Value(stream_text(node));
}

Result<Value> parse_toml_config(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SiteError{SiteError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description())};
    }
    return Result<Value>::ok(Value(from_table(doc)));
}

Result<Value> TomlModuleLoader::load(const std::filesystem::path& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SiteError{SiteError::IO,
            "cannot open config file: " + path.string()}.in_file(path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto parsed = parse_toml_config(ss.str());
    if (parsed.is_err()) {
        return std::move(parsed.error().in_file(path.string()));
    }
    return parsed;
}

} // namespace sitecfg
