#pragma once

#include "fd_table.hpp"
#include "vfs.hpp"

namespace syscompat
{
    /**
     * @brief The process-wide state the file syscalls read: mounted filesystem, working directory and descriptors.
     */
    class ProcessContext : public NonConstructible
    {
    private:
        std::shared_ptr<vfs::FileSystem> _fs;
        path::PathBuf _cwd;
        FdTable _fd_table;

    public:
        /** @param cwd Absolute path of the working directory inside `fs`. */
        explicit ProcessContext(std::shared_ptr<vfs::FileSystem> fs, path::PathBuf &&cwd);

        vfs::FileSystem &fs() const noexcept;
        const path::PathBuf &cwd() const noexcept;
        FdTable &fd_table() noexcept;
        const FdTable &fd_table() const noexcept;
    };

    io::Result<std::shared_ptr<vfs::FileLike>> get_file_like(const ProcessContext &context, int fd);

    /** @brief Looks up `fd` and requires it to be a directory, failing with `ENOTDIR` otherwise. */
    io::Result<std::shared_ptr<vfs::Directory>> get_directory(const ProcessContext &context, int fd);

    /**
     * @brief Combines a directory descriptor and a path into a normalized absolute path.
     *
     * Absolute paths ignore `dirfd`. Relative paths are joined onto the working directory when `dirfd`
     * is `AT_FDCWD`, and onto the path of the directory open at `dirfd` otherwise.
     */
    io::Result<path::PathBuf> handle_file_path(const ProcessContext &context, int dirfd, std::string_view path);
}
