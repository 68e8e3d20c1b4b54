#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sitecfg {

// Finds configuration files by name
class FileLocator {
public:
    virtual ~FileLocator() = default;

    // Nearest file named one of `names` in start_dir or any ancestor.
    // Within one directory, earlier names win.
    virtual std::optional<std::filesystem::path> find_up(
        const std::filesystem::path& start_dir,
        const std::vector<std::string>& names) const = 0;
};

// Walks real directories up to the filesystem root
class FilesystemLocator : public FileLocator {
public:
    std::optional<std::filesystem::path> find_up(
        const std::filesystem::path& start_dir,
        const std::vector<std::string>& names) const override;
};

} // namespace sitecfg
