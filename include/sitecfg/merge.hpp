#pragma once

#include <sitecfg/value.hpp>
#include <sitecfg/notice.hpp>

namespace sitecfg {

// Deprecated spelling of trailingSlash
inline constexpr const char* LEGACY_TRAILING_SLASH_KEY = "exportTrailingSlash";

// Copy of `user` without null-valued keys
Table clean_user_config(const Table& user);

// Copy of `user` with exportTrailingSlash folded into trailingSlash (only when
// trailingSlash is unset) and removed. Logs a deprecation warning when the
// legacy key is seen.
Table migrate_legacy_keys(const Table& user);

// Whether an `experimental` user value turns on anything that differs from
// the default experimental subtree
bool enables_experimental(const Value& user_value, const Value* default_value);

// Overlay `user` on `defaults`. Records merge one level deep over the
// default record; every other shape replaces the default wholesale. Keys only
// in `defaults` keep their default value. `experimental_notice` is fired when
// the user enables experimental features; it may be null.
Table merge_config(const Table& user, const Table& defaults,
                   OnceNotifier* experimental_notice);

} // namespace sitecfg
