#include <sitecfg/merge.hpp>
#include <sitecfg/log.hpp>

namespace sitecfg {

Table clean_user_config(const Table& user) {
    Table cleaned;
    for (const auto& [key, value] : user) {
        if (value.is_null()) continue;
        cleaned.set(key, value);
    }
    return cleaned;
}

Table migrate_legacy_keys(const Table& user) {
    const Value* legacy = user.find(LEGACY_TRAILING_SLASH_KEY);
    if (!legacy) return user;

    log::warn("%s The \"%s\" option has been renamed to \"trailingSlash\". "
              "Please update your configuration file.",
              log::bold("Warning:").c_str(), LEGACY_TRAILING_SLASH_KEY);

    Table migrated = user;
    if (!migrated.contains("trailingSlash")) {
        migrated.set("trailingSlash", *legacy);
    }
    migrated.erase(LEGACY_TRAILING_SLASH_KEY);
    return migrated;
}

bool enables_experimental(const Value& user_value, const Value* default_value) {
    if (user_value.is_null()) return false;
    if (!user_value.is_table() || !default_value || !default_value->is_table()) {
        return !default_value || user_value != *default_value;
    }
    for (const auto& [key, value] : user_value.as_table()) {
        if (value.is_null()) continue;
        const Value* def = default_value->find(key);
        if (!def || *def != value) return true;
    }
    return false;
}

// One-level merge of a user record over the default record for the same key
static Value merge_record(const Table& user, const Value* default_value) {
    Table merged;
    if (default_value && default_value->is_table()) {
        merged = default_value->as_table();
    }
    for (const auto& [key, value] : user) {
        if (value.is_null()) continue;
        merged.set(key, value);
    }
    return Value(std::move(merged));
}

Table merge_config(const Table& user, const Table& defaults,
                   OnceNotifier* experimental_notice) {
    Table overlay = migrate_legacy_keys(clean_user_config(user));

    Table result = defaults;
    for (const auto& [key, value] : overlay) {
        const Value* default_value = defaults.find(key);

        if (key == "experimental" && experimental_notice &&
            enables_experimental(value, default_value)) {
            experimental_notice->fire();
        }

        switch (value.shape()) {
            case Value::RecordShape:
                result.set(key, merge_record(value.as_table(), default_value));
                break;
            case Value::ScalarShape:
            case Value::SequenceShape:
            case Value::CallableShape:
                result.set(key, value);
                break;
        }
    }
    return result;
}

} // namespace sitecfg
