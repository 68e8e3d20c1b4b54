#include <catch2/catch.hpp>
#include <sitecfg/normalize.hpp>
#include <sitecfg/defaults.hpp>

using namespace sitecfg;

TEST_CASE("plain table passes through unchanged", "[normalize]") {
    Value raw(Table{{"basePath", "/docs"}});
    auto r = normalize_config("build", raw, default_config());
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == raw);
}

TEST_CASE("callable receives phase and the unmodified defaults", "[normalize]") {
    std::string seen_phase;
    Value seen_defaults;
    Value raw = Value::function([&](const Array& args) {
        seen_phase = args.at(0).as_string();
        seen_defaults = *args.at(1).find("defaultConfig");
        return Value(Table{{"distDir", "out"}});
    });

    auto r = normalize_config("dev", raw, default_config());
    REQUIRE(r.is_ok());
    REQUIRE(seen_phase == "dev");
    REQUIRE(seen_defaults == default_config());
    REQUIRE(r.value().find("distDir")->as_string() == "out");
}

TEST_CASE("callable may derive overrides from the defaults", "[normalize]") {
    Value raw = Value::function([](const Array& args) {
        const Value& defaults = *args.at(1).find("defaultConfig");
        Array exts = defaults.find("pageExtensions")->as_array();
        exts.push_back(Value("md"));
        return Value(Table{{"pageExtensions", exts}});
    });

    auto r = normalize_config("build", raw, default_config());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().find("pageExtensions")->as_array().back().as_string() == "md");
    // The registry itself is untouched
    REQUIRE(default_config().find("pageExtensions")->as_array().size() == 4);
}

TEST_CASE("promise-like result is rejected", "[normalize]") {
    Value raw = Value::function([](const Array&) {
        return Value(Table{{"then", Value::function([](const Array&) { return Value(); })}});
    });

    auto r = normalize_config("build", raw, default_config());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SiteError::UnsupportedSource);
}

TEST_CASE("a plain `then` key is not promise-like", "[normalize]") {
    REQUIRE_FALSE(is_promise_like(Value(Table{{"then", "later"}})));
    REQUIRE(is_promise_like(Value(Table{{"then", Value::function([](const Array&) { return Value(); })}})));

    Value raw = Value::function([](const Array&) { return Value(Table{{"then", "later"}}); });
    REQUIRE(normalize_config("build", raw, default_config()).is_ok());
}
