#include <sitecfg/site_config.hpp>
#include <sitecfg/validate.hpp>
#include <cmath>
#include <limits>

namespace sitecfg {

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

namespace {

// Typed access to one record of the merged configuration. Every key read
// through it is recorded as known; the rest end up in extra().
class FieldReader {
public:
    FieldReader(const Table& table, std::string prefix)
        : table_(table), prefix_(std::move(prefix)) {}

    // Present and not null
    const Value* get(const std::string& key) {
        known_.push_back(key);
        const Value* v = table_.find(key);
        return (v && !v->is_null()) ? v : nullptr;
    }

    std::string path(const std::string& key) const {
        return prefix_.empty() ? key : prefix_ + "." + key;
    }

    SiteError mismatch(const std::string& key, const char* expected, const Value& got) const {
        SiteError err{SiteError::TypeMismatch,
            "Specified " + path(key) + " should be " + expected + ", received " + got.type_name()};
        err.at(path(key));
        return err;
    }

    Status string(const std::string& key, std::string& out) {
        const Value* v = get(key);
        if (!v) return ok_status();
        if (!v->is_string()) return mismatch(key, "a string", *v);
        out = v->as_string();
        return ok_status();
    }

    Status optional_string(const std::string& key, std::optional<std::string>& out) {
        const Value* v = get(key);
        if (!v) return ok_status();
        if (!v->is_string()) return mismatch(key, "a string", *v);
        out = v->as_string();
        return ok_status();
    }

    Status boolean(const std::string& key, bool& out) {
        const Value* v = get(key);
        if (!v) return ok_status();
        if (!v->is_bool()) return mismatch(key, "a boolean", *v);
        out = v->as_bool();
        return ok_status();
    }

    Status optional_boolean(const std::string& key, std::optional<bool>& out) {
        const Value* v = get(key);
        if (!v) return ok_status();
        if (!v->is_bool()) return mismatch(key, "a boolean", *v);
        out = v->as_bool();
        return ok_status();
    }

    Status integer(const std::string& key, int64_t& out) {
        const Value* v = get(key);
        if (!v) return ok_status();
        if (v->is_integer()) {
            out = v->as_integer();
            return ok_status();
        }
        if (!is_whole(*v)) return mismatch(key, "a whole number", *v);
        // 2^63 is exact as a double; anything at or past it does not fit
        double n = v->as_number();
        if (n < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
            n >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return SiteError{SiteError::RangeViolation,
                "Specified " + path(key) + " is out of range, received " + v->to_display()}
                .at(path(key));
        }
        out = static_cast<int64_t>(n);
        return ok_status();
    }

    Status strings(const std::string& key, std::vector<std::string>& out) {
        const Value* v = get(key);
        if (!v) return ok_status();
        return read_strings(key, *v, out);
    }

    Status optional_strings(const std::string& key,
                            std::optional<std::vector<std::string>>& out) {
        const Value* v = get(key);
        if (!v) return ok_status();
        std::vector<std::string> list;
        SITECFG_TRY(read_strings(key, *v, list));
        out = std::move(list);
        return ok_status();
    }

    Status numbers(const std::string& key, std::vector<double>& out) {
        const Value* v = get(key);
        if (!v) return ok_status();
        if (!v->is_array()) return mismatch(key, "an array of numbers", *v);
        out.clear();
        for (const auto& elem : v->as_array()) {
            if (!elem.is_number()) return mismatch(key, "an array of numbers", elem);
            out.push_back(elem.as_number());
        }
        return ok_status();
    }

    Status table(const std::string& key, Table& out) {
        const Value* v = get(key);
        if (!v) return ok_status();
        if (!v->is_table()) return mismatch(key, "a table", *v);
        out = v->as_table();
        return ok_status();
    }

    // Function-valued hook; null leaves `out` null
    Status hook(const std::string& key, Value& out) {
        const Value* v = get(key);
        if (!v) return ok_status();
        if (!v->is_callable()) return mismatch(key, "a function", *v);
        out = *v;
        return ok_status();
    }

    // Nested record read by `read(const Table&, const std::string& prefix)`
    template<typename F>
    Status record(const std::string& key, F&& read) {
        const Value* v = get(key);
        if (!v) return ok_status();
        if (!v->is_table()) return mismatch(key, "a table", *v);
        return read(v->as_table(), path(key));
    }

    Table extra() const {
        Table out;
        for (const auto& [key, value] : table_) {
            bool is_known = false;
            for (const auto& k : known_) {
                if (k == key) { is_known = true; break; }
            }
            if (!is_known) out.set(key, value);
        }
        return out;
    }

private:
    static bool is_whole(const Value& v) {
        if (v.is_integer()) return true;
        return v.is_float() && std::isfinite(v.as_number()) &&
               v.as_number() == std::floor(v.as_number());
    }

    Status read_strings(const std::string& key, const Value& v,
                        std::vector<std::string>& out) {
        if (!v.is_array()) return mismatch(key, "an array of strings", v);
        out.clear();
        for (const auto& elem : v.as_array()) {
            if (!elem.is_string()) return mismatch(key, "an array of strings", elem);
            out.push_back(elem.as_string());
        }
        return ok_status();
    }

    const Table& table_;
    std::string prefix_;
    std::vector<std::string> known_;
};

Status read_images(const Table& t, const std::string& prefix, ImagesConfig& out) {
    FieldReader r(t, prefix);
    SITECFG_TRY(r.numbers("deviceSizes", out.device_sizes));
    SITECFG_TRY(r.numbers("imageSizes", out.image_sizes));
    SITECFG_TRY(r.strings("domains", out.domains));
    SITECFG_TRY(r.string("path", out.path));
    SITECFG_TRY(r.string("loader", out.loader));
    out.extra = r.extra();
    return ok_status();
}

Status read_domain(const Table& t, const std::string& prefix, DomainBinding& out) {
    FieldReader r(t, prefix);
    SITECFG_TRY(r.string("domain", out.domain));
    SITECFG_TRY(r.string("defaultLocale", out.default_locale));
    SITECFG_TRY(r.optional_strings("locales", out.locales));
    out.extra = r.extra();
    return ok_status();
}

Status read_i18n(const Table& t, const std::string& prefix, I18nConfig& out) {
    FieldReader r(t, prefix);
    SITECFG_TRY(r.strings("locales", out.locales));
    SITECFG_TRY(r.string("defaultLocale", out.default_locale));
    SITECFG_TRY(r.optional_boolean("localeDetection", out.locale_detection));

    if (const Value* domains = r.get("domains")) {
        if (!domains->is_array()) return r.mismatch("domains", "an array of tables", *domains);
        std::vector<DomainBinding> bindings;
        for (const auto& item : domains->as_array()) {
            if (!item.is_table()) return r.mismatch("domains", "an array of tables", item);
            DomainBinding binding;
            SITECFG_TRY(read_domain(item.as_table(), r.path("domains"), binding));
            bindings.push_back(std::move(binding));
        }
        out.domains = std::move(bindings);
    }

    out.extra = r.extra();
    return ok_status();
}

Status read_experimental(const Table& t, const std::string& prefix, ExperimentalConfig& out) {
    FieldReader r(t, prefix);
    SITECFG_TRY(r.integer("cpus", out.cpus));
    SITECFG_TRY(r.boolean("modern", out.modern));
    SITECFG_TRY(r.boolean("plugins", out.plugins));
    SITECFG_TRY(r.boolean("profiling", out.profiling));
    SITECFG_TRY(r.boolean("sprFlushToDisk", out.spr_flush_to_disk));
    SITECFG_TRY(r.string("reactMode", out.react_mode));
    SITECFG_TRY(r.boolean("workerThreads", out.worker_threads));
    SITECFG_TRY(r.boolean("pageEnv", out.page_env));
    SITECFG_TRY(r.boolean("productionBrowserSourceMaps", out.production_browser_source_maps));
    SITECFG_TRY(r.boolean("optimizeFonts", out.optimize_fonts));
    SITECFG_TRY(r.boolean("optimizeImages", out.optimize_images));
    SITECFG_TRY(r.boolean("scrollRestoration", out.scroll_restoration));

    if (const Value* i18n = r.get("i18n")) {
        if (i18n->is_table()) {
            I18nConfig cfg;
            SITECFG_TRY(read_i18n(i18n->as_table(), r.path("i18n"), cfg));
            out.i18n = std::move(cfg);
        } else if (!i18n->is_bool() || i18n->as_bool()) {
            return r.mismatch("i18n", "a table or false", *i18n);
        }
    }

    out.extra = r.extra();
    return ok_status();
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

Value strings_value(const std::vector<std::string>& list) {
    Array out;
    for (const auto& s : list) out.push_back(Value(s));
    return Value(std::move(out));
}

// Whole values go back out as integers
Value numbers_value(const std::vector<double>& list) {
    Array out;
    for (double n : list) {
        if (std::isfinite(n) && n == std::floor(n) && std::fabs(n) < 1e15) {
            out.push_back(Value(static_cast<long long>(n)));
        } else {
            out.push_back(Value(n));
        }
    }
    return Value(std::move(out));
}

void append_extra(Table& t, const Table& extra) {
    for (const auto& [key, value] : extra) {
        t.set(key, value);
    }
}

Value i18n_value(const I18nConfig& i18n) {
    Table t{
        {"locales", strings_value(i18n.locales)},
        {"defaultLocale", i18n.default_locale},
    };
    if (i18n.domains) {
        Array domains;
        for (const auto& binding : *i18n.domains) {
            Table d{
                {"domain", binding.domain},
                {"defaultLocale", binding.default_locale},
            };
            if (binding.locales) d.set("locales", strings_value(*binding.locales));
            append_extra(d, binding.extra);
            domains.push_back(Value(std::move(d)));
        }
        t.set("domains", Value(std::move(domains)));
    }
    if (i18n.locale_detection) t.set("localeDetection", *i18n.locale_detection);
    append_extra(t, i18n.extra);
    return Value(std::move(t));
}

} // namespace

Result<SiteConfig> SiteConfig::from_table(const Table& table) {
    SiteConfig cfg;
    FieldReader r(table, "");

    SITECFG_TRY(r.table("env", cfg.env));
    SITECFG_TRY(r.hook("bundler", cfg.bundler));
    SITECFG_TRY(r.hook("devMiddleware", cfg.dev_middleware));
    SITECFG_TRY(r.string("distDir", cfg.dist_dir));
    SITECFG_TRY(r.string("assetPrefix", cfg.asset_prefix));
    SITECFG_TRY(r.string("configOrigin", cfg.config_origin));
    SITECFG_TRY(r.optional_string("configFile", cfg.config_file));
    SITECFG_TRY(r.boolean("useFileSystemPublicRoutes", cfg.use_file_system_public_routes));
    SITECFG_TRY(r.hook("generateBuildId", cfg.generate_build_id));
    SITECFG_TRY(r.boolean("generateEtags", cfg.generate_etags));
    SITECFG_TRY(r.strings("pageExtensions", cfg.page_extensions));
    SITECFG_TRY(r.string("target", cfg.target));
    SITECFG_TRY(r.boolean("poweredByHeader", cfg.powered_by_header));
    SITECFG_TRY(r.boolean("compress", cfg.compress));
    SITECFG_TRY(r.string("analyticsId", cfg.analytics_id));

    SITECFG_TRY(r.record("images", [&](const Table& t, const std::string& prefix) -> Status {
        return read_images(t, prefix, cfg.images);
    }));
    SITECFG_TRY(r.record("devIndicators", [&](const Table& t, const std::string& prefix) -> Status {
        FieldReader nested(t, prefix);
        SITECFG_TRY(nested.boolean("buildActivity", cfg.dev_indicators.build_activity));
        SITECFG_TRY(nested.boolean("autoPrerender", cfg.dev_indicators.auto_prerender));
        cfg.dev_indicators.extra = nested.extra();
        return ok_status();
    }));
    SITECFG_TRY(r.record("onDemandEntries", [&](const Table& t, const std::string& prefix) -> Status {
        FieldReader nested(t, prefix);
        SITECFG_TRY(nested.integer("maxInactiveAge", cfg.on_demand_entries.max_inactive_age));
        SITECFG_TRY(nested.integer("pagesBufferLength", cfg.on_demand_entries.pages_buffer_length));
        cfg.on_demand_entries.extra = nested.extra();
        return ok_status();
    }));
    SITECFG_TRY(r.record("amp", [&](const Table& t, const std::string& prefix) -> Status {
        FieldReader nested(t, prefix);
        SITECFG_TRY(nested.string("canonicalBase", cfg.amp.canonical_base));
        cfg.amp.extra = nested.extra();
        return ok_status();
    }));

    SITECFG_TRY(r.string("basePath", cfg.base_path));
    SITECFG_TRY(r.table("sassOptions", cfg.sass_options));
    SITECFG_TRY(r.boolean("trailingSlash", cfg.trailing_slash));

    SITECFG_TRY(r.record("experimental", [&](const Table& t, const std::string& prefix) -> Status {
        return read_experimental(t, prefix, cfg.experimental);
    }));
    SITECFG_TRY(r.record("future", [&](const Table& t, const std::string& prefix) -> Status {
        FieldReader nested(t, prefix);
        SITECFG_TRY(nested.boolean("excludeDefaultMomentLocales",
                                   cfg.future.exclude_default_moment_locales));
        cfg.future.extra = nested.extra();
        return ok_status();
    }));

    SITECFG_TRY(r.table("serverRuntimeConfig", cfg.server_runtime_config));
    SITECFG_TRY(r.table("publicRuntimeConfig", cfg.public_runtime_config));
    SITECFG_TRY(r.boolean("reactStrictMode", cfg.react_strict_mode));

    cfg.extra = r.extra();
    return Result<SiteConfig>::ok(std::move(cfg));
}

Table SiteConfig::to_table() const {
    Table images_t{
        {"deviceSizes", numbers_value(images.device_sizes)},
        {"imageSizes", numbers_value(images.image_sizes)},
        {"domains", strings_value(images.domains)},
        {"path", images.path},
        {"loader", images.loader},
    };
    append_extra(images_t, images.extra);

    Table dev_t{
        {"buildActivity", dev_indicators.build_activity},
        {"autoPrerender", dev_indicators.auto_prerender},
    };
    append_extra(dev_t, dev_indicators.extra);

    Table entries_t{
        {"maxInactiveAge", static_cast<long long>(on_demand_entries.max_inactive_age)},
        {"pagesBufferLength", static_cast<long long>(on_demand_entries.pages_buffer_length)},
    };
    append_extra(entries_t, on_demand_entries.extra);

    Table amp_t{{"canonicalBase", amp.canonical_base}};
    append_extra(amp_t, amp.extra);

    Table exp_t{
        {"cpus", static_cast<long long>(experimental.cpus)},
        {"modern", experimental.modern},
        {"plugins", experimental.plugins},
        {"profiling", experimental.profiling},
        {"sprFlushToDisk", experimental.spr_flush_to_disk},
        {"reactMode", experimental.react_mode},
        {"workerThreads", experimental.worker_threads},
        {"pageEnv", experimental.page_env},
        {"productionBrowserSourceMaps", experimental.production_browser_source_maps},
        {"optimizeFonts", experimental.optimize_fonts},
        {"optimizeImages", experimental.optimize_images},
        {"scrollRestoration", experimental.scroll_restoration},
        {"i18n", experimental.i18n ? i18n_value(*experimental.i18n) : Value(false)},
    };
    append_extra(exp_t, experimental.extra);

    Table future_t{{"excludeDefaultMomentLocales", future.exclude_default_moment_locales}};
    append_extra(future_t, future.extra);

    Table t{
        {"env", env},
        {"bundler", bundler},
        {"devMiddleware", dev_middleware},
        {"distDir", dist_dir},
        {"assetPrefix", asset_prefix},
        {"configOrigin", config_origin},
    };
    if (config_file) t.set("configFile", *config_file);
    t.set("useFileSystemPublicRoutes", use_file_system_public_routes);
    t.set("generateBuildId", generate_build_id);
    t.set("generateEtags", generate_etags);
    t.set("pageExtensions", strings_value(page_extensions));
    t.set("target", target);
    t.set("poweredByHeader", powered_by_header);
    t.set("compress", compress);
    t.set("analyticsId", analytics_id);
    t.set("images", std::move(images_t));
    t.set("devIndicators", std::move(dev_t));
    t.set("onDemandEntries", std::move(entries_t));
    t.set("amp", std::move(amp_t));
    t.set("basePath", base_path);
    t.set("sassOptions", sass_options);
    t.set("trailingSlash", trailing_slash);
    t.set("experimental", std::move(exp_t));
    t.set("future", std::move(future_t));
    t.set("serverRuntimeConfig", server_runtime_config);
    t.set("publicRuntimeConfig", public_runtime_config);
    t.set("reactStrictMode", react_strict_mode);
    append_extra(t, extra);
    return t;
}

bool SiteConfig::is_serverless() const {
    return is_target_like_serverless(target);
}

} // namespace sitecfg
