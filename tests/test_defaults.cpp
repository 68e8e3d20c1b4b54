#include <catch2/catch.hpp>
#include <sitecfg/defaults.hpp>

using namespace sitecfg;

TEST_CASE("worker_count leaves one core free", "[defaults]") {
    REQUIRE(EnvDefaults::worker_count(0, 8) == 7);
    REQUIRE(EnvDefaults::worker_count(0, 1) == 1);
    REQUIRE(EnvDefaults::worker_count(0, 0) == 1);
    // Explicit node total wins over detected threads
    REQUIRE(EnvDefaults::worker_count(4, 64) == 3);
}

TEST_CASE("default tree carries every top-level group", "[defaults]") {
    EnvDefaults env;
    env.cpus = 3;
    env.analytics_id = "abc";
    Value defaults = build_default_config(env);
    REQUIRE(defaults.is_table());

    const Table& t = defaults.as_table();
    for (const char* key : {"env", "bundler", "devMiddleware", "distDir", "assetPrefix",
                            "configOrigin", "useFileSystemPublicRoutes", "generateBuildId",
                            "generateEtags", "pageExtensions", "target", "poweredByHeader",
                            "compress", "analyticsId", "images", "devIndicators",
                            "onDemandEntries", "amp", "basePath", "sassOptions",
                            "trailingSlash", "experimental", "future",
                            "serverRuntimeConfig", "publicRuntimeConfig", "reactStrictMode"}) {
        INFO(key);
        REQUIRE(t.contains(key));
    }

    REQUIRE(t.find("configOrigin")->as_string() == "default");
    REQUIRE(t.find("basePath")->as_string().empty());
    REQUIRE(t.find("analyticsId")->as_string() == "abc");
    REQUIRE(t.find("generateBuildId")->is_callable());
    REQUIRE(t.find("generateBuildId")->as_callable()(Array{}).is_null());
}

TEST_CASE("default experimental subtree", "[defaults]") {
    EnvDefaults env;
    env.cpus = 5;
    Value defaults = build_default_config(env);
    const Value* experimental = defaults.find("experimental");
    REQUIRE(experimental != nullptr);
    REQUIRE(experimental->find("cpus")->as_integer() == 5);
    REQUIRE(experimental->find("i18n")->is_bool());
    REQUIRE_FALSE(experimental->find("i18n")->as_bool());
    REQUIRE(experimental->find("workerThreads")->as_bool() == false);
    REQUIRE(experimental->find("reactMode")->as_string() == "legacy");
}

TEST_CASE("default images subtree", "[defaults]") {
    Value defaults = build_default_config(EnvDefaults{});
    const Value* images = defaults.find("images");
    REQUIRE(images->find("deviceSizes")->as_array().size() == 5);
    REQUIRE(images->find("imageSizes")->as_array().empty());
    REQUIRE(images->find("domains")->as_array().empty());
    REQUIRE(images->find("loader")->as_string() == "default");
}

TEST_CASE("process default_config() is built once", "[defaults]") {
    const Value& a = default_config();
    const Value& b = default_config();
    REQUIRE(&a == &b);
    REQUIRE(a.find("experimental")->find("cpus")->as_integer() >= 1);
}
