#include <catch2/catch.hpp>
#include <sitecfg/site_config.hpp>
#include <sitecfg/defaults.hpp>
#include <limits>

using namespace sitecfg;

static Table defaults_with(const std::string& key, Value value) {
    Table t = default_config().as_table();
    t.set(key, std::move(value));
    return t;
}

TEST_CASE("from_table reads the defaults", "[site_config]") {
    auto r = SiteConfig::from_table(default_config().as_table());
    REQUIRE(r.is_ok());
    const SiteConfig& cfg = r.value();

    REQUIRE(cfg.dist_dir == ".site");
    REQUIRE(cfg.config_origin == "default");
    REQUIRE_FALSE(cfg.config_file.has_value());
    REQUIRE(cfg.target == "server");
    REQUIRE_FALSE(cfg.is_serverless());
    REQUIRE(cfg.page_extensions == std::vector<std::string>{"tsx", "ts", "jsx", "js"});
    REQUIRE(cfg.images.device_sizes == std::vector<double>{320, 420, 768, 1024, 1200});
    REQUIRE(cfg.images.path == "/_site/image");
    REQUIRE(cfg.on_demand_entries.max_inactive_age == 60000);
    REQUIRE(cfg.bundler.is_null());
    REQUIRE(cfg.generate_build_id.is_callable());
    REQUIRE_FALSE(cfg.experimental.i18n.has_value());
    REQUIRE(cfg.experimental.react_mode == "legacy");
    REQUIRE(cfg.extra.empty());
    REQUIRE(cfg.images.extra.empty());
}

TEST_CASE("to_table reproduces the defaults", "[site_config]") {
    auto r = SiteConfig::from_table(default_config().as_table());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_table() == default_config().as_table());
}

TEST_CASE("absent keys keep field defaults", "[site_config]") {
    auto r = SiteConfig::from_table(Table{{"distDir", "out"}});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().dist_dir == "out");
    REQUIRE(r.value().compress);
    REQUIRE(r.value().config_origin == "default");
    REQUIRE(r.value().page_extensions.empty());
}

TEST_CASE("type mismatch names the key", "[site_config]") {
    auto r = SiteConfig::from_table(defaults_with("compress", "yes"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SiteError::TypeMismatch);
    REQUIRE(r.error().key == "compress");
    REQUIRE(r.error().message == "Specified compress should be a boolean, received string");
}

TEST_CASE("type mismatch in a nested record uses the dotted path", "[site_config]") {
    Table t = default_config().as_table();
    t.find("onDemandEntries")->as_table().set("maxInactiveAge", "soon");
    auto r = SiteConfig::from_table(t);
    REQUIRE(r.is_err());
    REQUIRE(r.error().key == "onDemandEntries.maxInactiveAge");

    Table u = default_config().as_table();
    u.find("experimental")->as_table().set("modern", 1);
    auto r2 = SiteConfig::from_table(u);
    REQUIRE(r2.is_err());
    REQUIRE(r2.error().key == "experimental.modern");
}

TEST_CASE("image sizes keep fractional values", "[site_config]") {
    Table t = default_config().as_table();
    t.find("images")->as_table().set("deviceSizes", Array{640.5, 1080});
    auto r = SiteConfig::from_table(t);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().images.device_sizes == std::vector<double>{640.5, 1080});

    // Whole sizes are written back as integers, fractional ones as floats
    Table out = r.value().to_table();
    const Array& sizes = out.find("images")->find("deviceSizes")->as_array();
    REQUIRE(sizes[0].is_float());
    REQUIRE(sizes[0].as_number() == Approx(640.5));
    REQUIRE(sizes[1].is_integer());

    t.find("images")->as_table().set("deviceSizes", Array{"640"});
    REQUIRE(SiteConfig::from_table(t).error().code == SiteError::TypeMismatch);
}

TEST_CASE("integer fields accept whole floats within range", "[site_config]") {
    Table t = default_config().as_table();
    t.find("onDemandEntries")->as_table().set("maxInactiveAge", 5000.0);
    auto r = SiteConfig::from_table(t);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().on_demand_entries.max_inactive_age == 5000);

    t.find("onDemandEntries")->as_table().set("maxInactiveAge", 1.5);
    REQUIRE(SiteConfig::from_table(t).error().code == SiteError::TypeMismatch);
}

TEST_CASE("integer fields reject values past the int64 range", "[site_config]") {
    for (double huge : {1e300, -1e300, 9223372036854775808.0}) {
        INFO(huge);
        Table t = default_config().as_table();
        t.find("onDemandEntries")->as_table().set("pagesBufferLength", huge);
        auto r = SiteConfig::from_table(t);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == SiteError::RangeViolation);
        REQUIRE(r.error().key == "onDemandEntries.pagesBufferLength");
    }

    Table t = default_config().as_table();
    t.find("experimental")->as_table().set("cpus", -9223372036854775808.0);
    auto r = SiteConfig::from_table(t);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().experimental.cpus == std::numeric_limits<int64_t>::min());
}

TEST_CASE("hooks must be functions", "[site_config]") {
    auto r = SiteConfig::from_table(defaults_with("bundler", "webpack"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().key == "bundler");

    Value hook = Value::function([](const Array&) { return Value(); });
    auto ok = SiteConfig::from_table(defaults_with("bundler", hook));
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().bundler == hook);
}

TEST_CASE("unknown keys pass through at every level", "[site_config]") {
    Table t = default_config().as_table();
    t.set("customKey", "kept");
    t.find("images")->as_table().set("quality", 80);
    t.find("experimental")->as_table().set("newFlag", true);

    auto r = SiteConfig::from_table(t);
    REQUIRE(r.is_ok());
    const SiteConfig& cfg = r.value();
    REQUIRE(cfg.extra.find("customKey")->as_string() == "kept");
    REQUIRE(cfg.images.extra.find("quality")->as_integer() == 80);
    REQUIRE(cfg.experimental.extra.find("newFlag")->as_bool());

    REQUIRE(cfg.to_table() == t);
}

TEST_CASE("i18n record round trip", "[site_config]") {
    Table i18n{
        {"locales", Array{"fr", "en-US"}},
        {"defaultLocale", "fr"},
        {"domains", Array{
            Table{{"domain", "example.fr"}, {"defaultLocale", "fr"}, {"locales", Array{"fr"}}},
            Table{{"domain", "example.com"}, {"defaultLocale", "en-US"}, {"http", true}},
        }},
        {"localeDetection", false},
    };
    Table t = default_config().as_table();
    t.find("experimental")->as_table().set("i18n", i18n);

    auto r = SiteConfig::from_table(t);
    REQUIRE(r.is_ok());
    const auto& cfg = r.value().experimental.i18n;
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->default_locale == "fr");
    REQUIRE(cfg->locale_detection == false);
    REQUIRE(cfg->domains->size() == 2);
    REQUIRE((*cfg->domains)[0].locales == std::vector<std::string>{"fr"});
    REQUIRE_FALSE((*cfg->domains)[1].locales.has_value());
    REQUIRE((*cfg->domains)[1].extra.find("http")->as_bool());

    REQUIRE(r.value().to_table() == t);
}

TEST_CASE("i18n true is rejected", "[site_config]") {
    Table t = default_config().as_table();
    t.find("experimental")->as_table().set("i18n", true);
    auto r = SiteConfig::from_table(t);
    REQUIRE(r.is_err());
    REQUIRE(r.error().key == "experimental.i18n");
}

TEST_CASE("configFile is carried when present", "[site_config]") {
    Table t = default_config().as_table();
    t.set("configOrigin", "site.config.toml");
    t.set("configFile", "/srv/app/site.config.toml");
    auto r = SiteConfig::from_table(t);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().config_file == std::string("/srv/app/site.config.toml"));
    REQUIRE(r.value().to_table() == t);
}

TEST_CASE("is_serverless()", "[site_config]") {
    SiteConfig cfg;
    cfg.target = "experimental-serverless-trace";
    REQUIRE(cfg.is_serverless());
}
