#include <sitecfg/normalize.hpp>

namespace sitecfg {

bool is_promise_like(const Value& v) {
    const Value* then = v.find("then");
    return then && then->is_callable();
}

Result<Value> normalize_config(const std::string& phase,
                               const Value& raw,
                               const Value& defaults) {
    if (!raw.is_callable()) {
        return Result<Value>::ok(raw);
    }

    Array args{Value(phase), Table{{"defaultConfig", defaults}}};
    Value produced = raw.as_callable()(args);

    if (is_promise_like(produced)) {
        return SiteError{SiteError::UnsupportedSource,
            "configuration function returned a pending asynchronous result",
            "return the configuration table directly; asynchronous configuration is not supported"};
    }
    return Result<Value>::ok(std::move(produced));
}

} // namespace sitecfg
