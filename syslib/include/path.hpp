#pragma once

#include "pch.hpp"

namespace path
{
    /**
     * @brief An owned, mutable path.
     *
     * @see https://doc.rust-lang.org/std/path/struct.PathBuf.html
     */
    using PathBuf = std::filesystem::path;

    /**
     * @brief Whether `path` starts at the root, i.e. begins with a separator.
     */
    inline bool has_root(std::string_view path) noexcept
    {
        return !path.empty() && path.front() == '/';
    }
}
