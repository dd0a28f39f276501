#include "context.hpp"

namespace syscompat
{
    ProcessContext::ProcessContext(std::shared_ptr<vfs::FileSystem> fs, path::PathBuf &&cwd)
        : NonConstructible(NonConstructibleTag::TAG), _fs(std::move(fs)), _cwd(std::move(cwd)), _fd_table() {}

    vfs::FileSystem &ProcessContext::fs() const noexcept
    {
        return *_fs;
    }

    const path::PathBuf &ProcessContext::cwd() const noexcept
    {
        return _cwd;
    }

    FdTable &ProcessContext::fd_table() noexcept
    {
        return _fd_table;
    }

    const FdTable &ProcessContext::fd_table() const noexcept
    {
        return _fd_table;
    }

    io::Result<std::shared_ptr<vfs::FileLike>> get_file_like(const ProcessContext &context, int fd)
    {
        return context.fd_table().get(fd);
    }

    io::Result<std::shared_ptr<vfs::Directory>> get_directory(const ProcessContext &context, int fd)
    {
        auto file = SHORT_CIRCUIT(std::shared_ptr<vfs::Directory>, get_file_like(context, fd));

        auto dir = std::dynamic_pointer_cast<vfs::Directory>(file);
        if (dir == nullptr)
        {
            return io::Result<std::shared_ptr<vfs::Directory>>::err(io::Error::from_raw_os_error(ENOTDIR));
        }

        return io::Result<std::shared_ptr<vfs::Directory>>::ok(std::move(dir));
    }

    io::Result<path::PathBuf> handle_file_path(const ProcessContext &context, int dirfd, std::string_view path)
    {
        if (path::has_root(path))
        {
            return io::Result<path::PathBuf>::ok(path::PathBuf(path).lexically_normal());
        }

        if (dirfd == AT_FDCWD)
        {
            return io::Result<path::PathBuf>::ok((context.cwd() / path).lexically_normal());
        }

        auto dir = SHORT_CIRCUIT(path::PathBuf, get_directory(context, dirfd));
        return io::Result<path::PathBuf>::ok((dir->path() / path).lexically_normal());
    }
}
