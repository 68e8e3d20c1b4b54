#pragma once

#include <sitecfg/result.hpp>
#include <sitecfg/value.hpp>
#include <string>

namespace sitecfg {

// A record exposing a callable `then` member: the shape of a pending
// asynchronous result
bool is_promise_like(const Value& v);

// Resolve a raw configuration source.
//
// A callable is invoked as fn(phase, { defaultConfig: defaults }) and its
// return value used instead. A promise-like result is an UnsupportedSource
// error. Any other value is returned unchanged.
Result<Value> normalize_config(const std::string& phase,
                               const Value& raw,
                               const Value& defaults);

} // namespace sitecfg
