#pragma once

#include <vector>

#include "context.hpp"
#include "logging.hpp"

namespace syscompat
{
    /** @brief A descriptor opened before the first syscall runs. */
    struct DescriptorEntry
    {
        int fd;
        std::string path;
    };

    struct Config
    {
        /** @brief Host directory that becomes `/`. */
        std::string root;
        std::string cwd = "/";
        logging::Level log_level = logging::Level::Warn;
        std::vector<DescriptorEntry> descriptors;
    };

    /** @brief `$HOME/.config/syscompat.json`, or a path relative to the working directory without `HOME`. */
    path::PathBuf default_config_path();

    /** @brief Parses a JSON document. Malformed input is `InvalidData`, relative paths are `InvalidInput`. */
    io::Result<Config> parse_config(const std::string &text);

    io::Result<Config> load_config(const path::PathBuf &path);

    /** @brief Mounts the configured root and opens every configured descriptor. */
    io::Result<std::unique_ptr<ProcessContext>> build_context(const Config &config);
}
