#include <sitecfg/locate.hpp>
#include <sitecfg/log.hpp>

namespace sitecfg {

namespace fs = std::filesystem;

std::optional<fs::path> FilesystemLocator::find_up(
    const fs::path& start_dir,
    const std::vector<std::string>& names) const
{
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            log::debug("cannot resolve path: %s", start_dir.string().c_str());
            return std::nullopt;
        }
    }

    while (true) {
        for (const auto& name : names) {
            fs::path candidate = dir / name;
            if (fs::is_regular_file(candidate, ec)) {
                return candidate;
            }
        }

        fs::path parent = dir.parent_path();
        if (parent == dir) {
            // Reached filesystem root
            return std::nullopt;
        }
        dir = parent;
    }
}

} // namespace sitecfg
