// demo_resolve.cpp
//
// Resolves the effective site configuration for a directory and prints it as
// JSON on stdout. Run it with:
//
//     ./demo_resolve                         # current directory, phase "build"
//     ./demo_resolve path/to/app             # walks up from path/to/app
//     ./demo_resolve path/to/app dev -v      # phase "dev", debug logging
//
// Errors are printed to stderr in the usual error[Code] format.

#include <sitecfg/resolver.hpp>
#include <sitecfg/log.hpp>

#include <cstring>
#include <iostream>
#include <string>

using namespace sitecfg;

int main(int argc, char** argv) {
    std::string dir = ".";
    std::string phase = "build";
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0) {
            log::set_level(log::Debug);
            continue;
        }
        if (positional == 0) dir = argv[i];
        else if (positional == 1) phase = argv[i];
        ++positional;
    }

    OnceNotifier experimental_notice(warn_experimental_features);
    auto cfg = load_config(phase, dir, experimental_notice);
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }

    log::info("configuration origin: %s", cfg.value().config_origin.c_str());
    std::cout << Value(cfg.value().to_table()).to_json() << "\n";
    return 0;
}
