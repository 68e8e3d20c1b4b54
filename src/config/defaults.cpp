#include <sitecfg/defaults.hpp>
#include <algorithm>
#include <cstdlib>
#include <thread>

namespace sitecfg {

int EnvDefaults::worker_count(int node_total, unsigned hardware_threads) {
    int total = node_total > 0 ? node_total : static_cast<int>(hardware_threads);
    if (total <= 0) total = 1;
    return std::max(1, total - 1);
}

static int parse_positive(const char* text) {
    if (!text || !*text) return 0;
    char* end = nullptr;
    long n = std::strtol(text, &end, 10);
    if (*end != '\0' || n <= 0 || n > 1 << 20) return 0;
    return static_cast<int>(n);
}

EnvDefaults EnvDefaults::from_process() {
    EnvDefaults env;
    env.cpus = worker_count(parse_positive(std::getenv("SITECFG_NODE_TOTAL")),
                            std::thread::hardware_concurrency());
    if (const char* id = std::getenv("SITECFG_ANALYTICS_ID")) {
        env.analytics_id = id;
    }
    return env;
}

Value build_default_config(const EnvDefaults& env) {
    Table images{
        {"deviceSizes", Array{320, 420, 768, 1024, 1200}},
        {"imageSizes", Array{}},
        {"domains", Array{}},
        {"path", "/_site/image"},
        {"loader", "default"},
    };

    Table experimental{
        {"cpus", env.cpus},
        {"modern", false},
        {"plugins", false},
        {"profiling", false},
        {"sprFlushToDisk", true},
        {"reactMode", "legacy"},
        {"workerThreads", false},
        {"pageEnv", false},
        {"productionBrowserSourceMaps", false},
        {"optimizeFonts", false},
        {"optimizeImages", false},
        {"scrollRestoration", false},
        {"i18n", false},
    };

    Table root{
        {"env", Table{}},
        {"bundler", nullptr},
        {"devMiddleware", nullptr},
        {"distDir", ".site"},
        {"assetPrefix", ""},
        {"configOrigin", "default"},
        {"useFileSystemPublicRoutes", true},
        {"generateBuildId", Value::function([](const Array&) { return Value(); })},
        {"generateEtags", true},
        {"pageExtensions", Array{"tsx", "ts", "jsx", "js"}},
        {"target", "server"},
        {"poweredByHeader", true},
        {"compress", true},
        {"analyticsId", env.analytics_id},
        {"images", std::move(images)},
        {"devIndicators", Table{{"buildActivity", true}, {"autoPrerender", true}}},
        {"onDemandEntries", Table{{"maxInactiveAge", 60 * 1000}, {"pagesBufferLength", 2}}},
        {"amp", Table{{"canonicalBase", ""}}},
        {"basePath", ""},
        {"sassOptions", Table{}},
        {"trailingSlash", false},
        {"experimental", std::move(experimental)},
        {"future", Table{{"excludeDefaultMomentLocales", false}}},
        {"serverRuntimeConfig", Table{}},
        {"publicRuntimeConfig", Table{}},
        {"reactStrictMode", false},
    };
    return Value(std::move(root));
}

const Value& default_config() {
    static const Value defaults = build_default_config(EnvDefaults::from_process());
    return defaults;
}

} // namespace sitecfg
