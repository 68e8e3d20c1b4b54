#include <sitecfg/validate.hpp>
#include <sitecfg/log.hpp>
#include <algorithm>

namespace sitecfg {

const std::vector<std::string> TARGETS = {
    "server", "serverless", "experimental-serverless-trace"};

const std::vector<std::string> REACT_MODES = {
    "legacy", "blocking", "concurrent"};

bool is_target_like_serverless(const std::string& target) {
    return target == "serverless" || target == "experimental-serverless-trace";
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool contains(const std::vector<std::string>& set, const std::string& s) {
    return std::find(set.begin(), set.end(), s) != set.end();
}

static std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

static bool ends_with(const std::string& s, char c) {
    return !s.empty() && s.back() == c;
}

// A key that is absent or null counts as unset
static const Value* find_set(const Table& t, const std::string& key) {
    const Value* v = t.find(key);
    return (v && !v->is_null()) ? v : nullptr;
}

static Table* find_table(Table& t, const std::string& key) {
    Value* v = t.find(key);
    return (v && v->is_table()) ? &v->as_table() : nullptr;
}

static const Table* find_table(const Table& t, const std::string& key) {
    const Value* v = t.find(key);
    return (v && v->is_table()) ? &v->as_table() : nullptr;
}

static const char* type_of(const Value* v) {
    return v ? v->type_name() : "nothing";
}

// ---------------------------------------------------------------------------
// Pre-merge checks
// ---------------------------------------------------------------------------

Result<Table> check_user_config(const Table& user) {
    if (const Value* target = find_set(user, "target")) {
        if (!target->is_string() || !contains(TARGETS, target->as_string())) {
            return SiteError{SiteError::EnumViolation,
                "Specified target is invalid. Provided: \"" + target->to_display() +
                "\" should be one of " + join(TARGETS)}.at("target");
        }
    }

    Table normalized = user;

    if (Table* amp = find_table(normalized, "amp")) {
        Value* base = amp->find("canonicalBase");
        if (base && base->is_string() && ends_with(base->as_string(), '/')) {
            std::string stripped = base->as_string();
            stripped.pop_back();
            *base = Value(std::move(stripped));
        }
    }

    if (const Table* experimental = find_table(user, "experimental")) {
        if (const Value* mode = find_set(*experimental, "reactMode")) {
            if (!mode->is_string() || !contains(REACT_MODES, mode->as_string())) {
                return SiteError{SiteError::EnumViolation,
                    "Specified React Mode is invalid. Provided: " + mode->to_display() +
                    " should be one of " + join(REACT_MODES)}.at("experimental.reactMode");
            }
        }
    }

    return Result<Table>::ok(std::move(normalized));
}

// ---------------------------------------------------------------------------
// Paths and prefixes
// ---------------------------------------------------------------------------

Status check_dist_dir(const Table& config) {
    const Value* dist = config.find("distDir");
    if (!dist) return ok_status();

    if (!dist->is_string()) {
        return SiteError{SiteError::TypeMismatch,
            std::string("Specified distDir is not a string, found type \"") +
            dist->type_name() + "\""}.at("distDir");
    }

    std::string dir = trim(dist->as_string());
    if (dir == RESERVED_DIST_DIR) {
        return SiteError{SiteError::ReservedValue,
            "The 'public' directory is reserved and can not be set as the 'distDir'",
            "choose another output directory, e.g. \".site\""}.at("distDir");
    }
    if (dir.empty()) {
        return SiteError{SiteError::RangeViolation,
            "Invalid distDir provided, distDir can not be an empty string",
            "remove this setting or leave it unset"}.at("distDir");
    }
    return ok_status();
}

Status check_page_extensions(const Table& config) {
    const Value* exts = config.find("pageExtensions");
    if (!exts) return ok_status();

    if (!exts->is_array()) {
        return SiteError{SiteError::TypeMismatch,
            "Specified pageExtensions is not an array of strings, found \"" +
            exts->to_display() + "\". Please update this config or remove it."}.at("pageExtensions");
    }
    if (exts->as_array().empty()) {
        return SiteError{SiteError::RangeViolation,
            "Specified pageExtensions is an empty array. Please update it with "
            "the relevant extensions or remove it."}.at("pageExtensions");
    }
    for (const auto& ext : exts->as_array()) {
        if (!ext.is_string()) {
            return SiteError{SiteError::TypeMismatch,
                "Specified pageExtensions is not an array of strings, found \"" +
                ext.to_display() + "\" of type \"" + ext.type_name() +
                "\". Please update this config or remove it."}.at("pageExtensions");
        }
    }
    return ok_status();
}

Status check_asset_prefix(const Table& config) {
    const Value* prefix = config.find("assetPrefix");
    if (prefix && !prefix->is_string()) {
        return SiteError{SiteError::TypeMismatch,
            std::string("Specified assetPrefix is not a string, found type \"") +
            prefix->type_name() + "\""}.at("assetPrefix");
    }
    return ok_status();
}

Status check_base_path(const Table& config) {
    const Value* base = config.find("basePath");
    if (!base) return ok_status();

    if (!base->is_string()) {
        return SiteError{SiteError::TypeMismatch,
            std::string("Specified basePath is not a string, found type \"") +
            base->type_name() + "\""}.at("basePath");
    }

    const std::string& path = base->as_string();
    if (path.empty()) return ok_status();

    if (path == "/") {
        return SiteError{SiteError::StructuralViolation,
            "Specified basePath /. basePath has to be either an empty string or a path prefix"}
            .at("basePath");
    }
    if (path.front() != '/') {
        return SiteError{SiteError::StructuralViolation,
            "Specified basePath has to start with a /, found \"" + path + "\""}.at("basePath");
    }
    if (ends_with(path, '/')) {
        return SiteError{SiteError::StructuralViolation,
            "Specified basePath should not end with /, found \"" + path + "\""}.at("basePath");
    }
    return ok_status();
}

void apply_base_path(Table& config) {
    const Value* base = config.find("basePath");
    if (!base || !base->is_string() || base->as_string().empty()) return;
    Value path = *base;

    Value* prefix = config.find("assetPrefix");
    if (prefix && prefix->is_string() && prefix->as_string().empty()) {
        *prefix = path;
    }

    if (Table* amp = find_table(config, "amp")) {
        Value* canonical = amp->find("canonicalBase");
        if (canonical && canonical->is_string() && canonical->as_string().empty()) {
            *canonical = path;
        }
    }
}

// ---------------------------------------------------------------------------
// Images
// ---------------------------------------------------------------------------

Status check_images(const Table& config) {
    const Value* images = find_set(config, "images");
    if (images && !images->is_table()) {
        return SiteError{SiteError::TypeMismatch,
            std::string("Specified images should be a table, received ") +
            images->type_name()}.at("images");
    }
    return ok_status();
}

void normalize_image_path(Table& config) {
    Table* images = find_table(config, "images");
    if (!images) return;
    Value* path = images->find("path");
    if (!path || !path->is_string() || path->as_string().empty()) return;
    if (!ends_with(path->as_string(), '/')) {
        *path = Value(path->as_string() + "/");
    }
}

Status check_image_domains(const Table& config) {
    const Table* images = find_table(config, "images");
    if (!images) return ok_status();
    const Value* domains = find_set(*images, "domains");
    if (!domains) return ok_status();

    if (!domains->is_array()) {
        return SiteError{SiteError::TypeMismatch,
            std::string("Specified images.domains should be an array, received ") +
            domains->type_name()}.at("images.domains");
    }

    const Array& list = domains->as_array();
    if (list.size() > MAX_IMAGE_DOMAINS) {
        return SiteError{SiteError::RangeViolation,
            "Specified images.domains exceeds length of " + std::to_string(MAX_IMAGE_DOMAINS) +
            ", received length (" + std::to_string(list.size()) +
            "), please reduce the length of the array to continue"}.at("images.domains");
    }

    Array invalid;
    for (const auto& d : list) {
        if (!d.is_string()) invalid.push_back(d);
    }
    if (!invalid.empty()) {
        return SiteError{SiteError::TypeMismatch,
            "Specified images.domains should be an array of strings, received invalid values (" +
            join_display(invalid) + ")"}.at("images.domains");
    }
    return ok_status();
}

Status check_image_sizes(const Table& config, const std::string& field) {
    const Table* images = find_table(config, "images");
    if (!images) return ok_status();
    const Value* sizes = find_set(*images, field);
    if (!sizes) return ok_status();

    std::string key = "images." + field;
    if (!sizes->is_array()) {
        return SiteError{SiteError::TypeMismatch,
            "Specified " + key + " should be an array, received " + sizes->type_name()}.at(key);
    }

    const Array& list = sizes->as_array();
    if (list.size() > MAX_IMAGE_SIZES) {
        return SiteError{SiteError::RangeViolation,
            "Specified " + key + " exceeds length of " + std::to_string(MAX_IMAGE_SIZES) +
            ", received length (" + std::to_string(list.size()) +
            "), please reduce the length of the array to continue"}.at(key);
    }

    Array invalid;
    for (const auto& s : list) {
        // Written so NaN falls outside the range
        if (!s.is_number() || !(s.as_number() >= MIN_IMAGE_SIZE && s.as_number() <= MAX_IMAGE_SIZE)) {
            invalid.push_back(s);
        }
    }
    if (!invalid.empty()) {
        return SiteError{SiteError::RangeViolation,
            "Specified " + key + " should be an array of numbers that are between 1 and 10000, "
            "received invalid values (" + join_display(invalid) + ")"}.at(key);
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Internationalization
// ---------------------------------------------------------------------------

static const char* DOMAIN_FORMAT_HINT =
    "{ domain = \"example.fr\", defaultLocale = \"fr\", locales = [\"fr\"] }";

static bool is_nonempty_string(const Value* v) {
    return v && v->is_string() && !v->as_string().empty();
}

static bool claims_locale(const Value& record, const Value& locale) {
    const Value* locales = record.find("locales");
    if (!locales || !locales->is_array()) return false;
    const Array& list = locales->as_array();
    return std::find(list.begin(), list.end(), locale) != list.end();
}

// A domain record is valid when it carries a domain, a default locale and
// only string locales that no other record also claims
static bool is_valid_domain(const Array& domains, size_t index) {
    const Value& item = domains[index];
    if (!item.is_table()) return false;
    if (!is_nonempty_string(item.find("defaultLocale"))) return false;
    if (!is_nonempty_string(item.find("domain"))) return false;

    const Value* locales = item.find("locales");
    if (!locales || locales->is_null()) return true;
    if (!locales->is_array()) return false;

    bool valid = true;
    for (const auto& locale : locales->as_array()) {
        if (!locale.is_string()) valid = false;

        for (size_t other = 0; other < domains.size(); ++other) {
            if (other == index) continue;
            if (claims_locale(domains[other], locale)) {
                const Value* other_domain = domains[other].find("domain");
                log::warn("Both %s and %s configured the locale (%s) but only one can. "
                          "Remove it from one i18n.domains config to continue",
                          item.find("domain")->as_string().c_str(),
                          other_domain ? other_domain->to_display().c_str() : "(unnamed)",
                          locale.to_display().c_str());
                valid = false;
                break;
            }
        }
    }
    return valid;
}

Status check_i18n(const Table& config) {
    const Table* experimental = find_table(config, "experimental");
    if (!experimental) return ok_status();
    const Value* raw = experimental->find("i18n");
    if (!raw || raw->is_null() || (raw->is_bool() && !raw->as_bool())) {
        return ok_status();
    }
    if (!raw->is_table()) {
        return SiteError{SiteError::TypeMismatch,
            std::string("Specified i18n should be a table, received ") + raw->type_name()}
            .at("experimental.i18n");
    }
    const Table& i18n = raw->as_table();

    const Value* locales = i18n.find("locales");
    if (!locales || !locales->is_array()) {
        return SiteError{SiteError::TypeMismatch,
            std::string("Specified i18n.locales should be an array, received ") + type_of(locales),
            "e.g. locales = [\"en-US\", \"nl-NL\"]"}.at("experimental.i18n.locales");
    }
    if (locales->as_array().empty()) {
        return SiteError{SiteError::StructuralViolation,
            "Specified i18n.locales should contain at least one locale"}
            .at("experimental.i18n.locales");
    }

    const Value* default_locale = i18n.find("defaultLocale");
    if (!is_nonempty_string(default_locale)) {
        return SiteError{SiteError::TypeMismatch,
            "Specified i18n.defaultLocale should be a string"}
            .at("experimental.i18n.defaultLocale");
    }

    const Value* domains = find_set(i18n, "domains");
    if (domains && !domains->is_array()) {
        return SiteError{SiteError::TypeMismatch,
            std::string("Specified i18n.domains must be an array of domain tables e.g. [ ") +
            DOMAIN_FORMAT_HINT + " ] received " + domains->type_name()}
            .at("experimental.i18n.domains");
    }
    if (domains) {
        const Array& list = domains->as_array();
        std::string invalid;
        for (size_t i = 0; i < list.size(); ++i) {
            if (is_valid_domain(list, i)) continue;
            invalid += "\n" + list[i].to_json();
        }
        if (!invalid.empty()) {
            return SiteError{SiteError::StructuralViolation,
                "Invalid i18n.domains values:" + invalid +
                "\n\ndomains value must follow format " + DOMAIN_FORMAT_HINT}
                .at("experimental.i18n.domains");
        }
    }

    for (const auto& locale : locales->as_array()) {
        if (!locale.is_string()) {
            return SiteError{SiteError::TypeMismatch,
                "Specified i18n.locales contains invalid values, locales must be valid "
                "locale tags provided as strings e.g. \"en-US\"."}
                .at("experimental.i18n.locales");
        }
    }

    const Array& list = locales->as_array();
    if (std::find(list.begin(), list.end(), *default_locale) == list.end()) {
        return SiteError{SiteError::StructuralViolation,
            "Specified i18n.defaultLocale should be included in i18n.locales"}
            .at("experimental.i18n.defaultLocale");
    }

    const Value* detection = find_set(i18n, "localeDetection");
    if (detection && !detection->is_bool()) {
        return SiteError{SiteError::TypeMismatch,
            std::string("Specified i18n.localeDetection should be unset or a boolean, received ") +
            detection->type_name()}.at("experimental.i18n.localeDetection");
    }
    return ok_status();
}

void reorder_locales(Table& config) {
    Table* experimental = find_table(config, "experimental");
    if (!experimental) return;
    Table* i18n = find_table(*experimental, "i18n");
    if (!i18n) return;

    Value* locales = i18n->find("locales");
    const Value* default_locale = i18n->find("defaultLocale");
    if (!locales || !locales->is_array() || !is_nonempty_string(default_locale)) return;

    Array reordered{*default_locale};
    for (const auto& locale : locales->as_array()) {
        if (locale != *default_locale) reordered.push_back(locale);
    }
    *locales = Value(std::move(reordered));
}

// ---------------------------------------------------------------------------
// Chain
// ---------------------------------------------------------------------------

const std::vector<ValidatorPass>& validator_chain() {
    static const std::vector<ValidatorPass> chain = {
        {"distDir", false, [](Table& c) { return check_dist_dir(c); }},
        {"pageExtensions", false, [](Table& c) { return check_page_extensions(c); }},
        {"assetPrefix", false, [](Table& c) { return check_asset_prefix(c); }},
        {"basePath", false, [](Table& c) { return check_base_path(c); }},
        {"basePath propagation", true, [](Table& c) { apply_base_path(c); return ok_status(); }},
        {"images", false, [](Table& c) { return check_images(c); }},
        {"images.path", true, [](Table& c) { normalize_image_path(c); return ok_status(); }},
        {"images.domains", false, [](Table& c) { return check_image_domains(c); }},
        {"images.deviceSizes", false, [](Table& c) { return check_image_sizes(c, "deviceSizes"); }},
        {"images.imageSizes", false, [](Table& c) { return check_image_sizes(c, "imageSizes"); }},
        {"experimental.i18n", false, [](Table& c) { return check_i18n(c); }},
        {"locale order", true, [](Table& c) { reorder_locales(c); return ok_status(); }},
    };
    return chain;
}

Status validate_config(Table& config) {
    for (const auto& pass : validator_chain()) {
        log::trace("validate: %s", pass.name);
        SITECFG_TRY(pass.run(config));
    }
    return ok_status();
}

} // namespace sitecfg
