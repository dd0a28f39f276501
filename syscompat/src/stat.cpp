#include "stat.hpp"
#include "logging.hpp"
#include "sys.hpp"

namespace
{
    std::string _format_path(const std::optional<std::string_view> &path)
    {
        return path.has_value() ? std::format("\"{}\"", *path) : std::string("null");
    }
}

namespace syscompat
{
    io::Result<ResolutionTarget> classify_target(int dirfd, std::optional<std::string_view> path, uint32_t flags)
    {
        if (!path.has_value() || path->empty())
        {
            if ((flags & AT_EMPTY_PATH) == 0)
            {
                return io::Result<ResolutionTarget>::err(io::Error::from_raw_os_error(ENOENT));
            }

            return io::Result<ResolutionTarget>::ok(FdOnly{dirfd});
        }

        if (path::has_root(*path))
        {
            return io::Result<ResolutionTarget>::ok(AbsolutePath{*path});
        }

        if (dirfd == AT_FDCWD)
        {
            return io::Result<ResolutionTarget>::ok(CwdRelativePath{*path});
        }

        return io::Result<ResolutionTarget>::ok(FdRelativePath{dirfd, *path});
    }

    io::Result<OpenedObject> open_and_classify(vfs::FileSystem &filesystem, const path::PathBuf &path)
    {
        // Opening only to stat: a FIFO must not wait for a writer and a tty must not become controlling.
        fs::OpenOptions options;
        options.read(true).custom_flags(O_NONBLOCK | O_NOCTTY);

        auto file = filesystem.open_file(path, options);
        if (file.is_ok())
        {
            return io::Result<OpenedObject>::ok(OpenedObject(std::move(file).into_ok()));
        }

        if (file.unwrap_err().kind() != io::ErrorKind::IsADirectory)
        {
            return io::Result<OpenedObject>::err(std::move(file).into_err());
        }

        auto dir = SHORT_CIRCUIT(OpenedObject, filesystem.open_dir(path, options));
        return io::Result<OpenedObject>::ok(OpenedObject(std::move(dir)));
    }

    io::Result<Kstat> stat_at_path(vfs::FileSystem &filesystem, const path::PathBuf &path)
    {
        auto object = SHORT_CIRCUIT(Kstat, open_and_classify(filesystem, path));
        return std::visit([](const auto &handle)
                          { return handle->stat(); },
                          object);
    }

    io::Result<Kstat> stat_target(const ProcessContext &context, const ResolutionTarget &target)
    {
        if (auto fd_only = std::get_if<FdOnly>(&target))
        {
            auto file = SHORT_CIRCUIT(Kstat, get_file_like(context, fd_only->fd));
            return file->stat();
        }

        int dirfd = AT_FDCWD;
        std::string_view relative;
        if (auto absolute = std::get_if<AbsolutePath>(&target))
        {
            relative = absolute->path;
        }
        else if (auto cwd_relative = std::get_if<CwdRelativePath>(&target))
        {
            relative = cwd_relative->path;
        }
        else
        {
            auto &fd_relative = std::get<FdRelativePath>(target);
            dirfd = fd_relative.dirfd;
            relative = fd_relative.path;
        }

        auto path = SHORT_CIRCUIT(Kstat, handle_file_path(context, dirfd, relative));
        return stat_at_path(context.fs(), path);
    }

    long to_syscall_return(const char *name, io::Result<long> &&result)
    {
        long ret;
        if (result.is_ok())
        {
            ret = result.unwrap();
        }
        else
        {
            auto &error = result.unwrap_err();
            ret = -static_cast<long>(error.raw_os_error().value_or(sys::encode_error_kind(error.kind())));
            logging::trace("{} failed: {}", name, error.message());
        }

        logging::trace("{} => {}", name, ret);
        return ret;
    }

    namespace
    {
        io::Result<long> _stat(const ProcessContext &context, UserConstPtr<char> path, UserPtr<abi::Stat> statbuf)
        {
            auto str = SHORT_CIRCUIT(long, path.get_as_str());
            logging::debug("sys_stat <= path: \"{}\"", str);

            auto target = SHORT_CIRCUIT(long, classify_target(AT_FDCWD, str, 0));
            auto kstat = SHORT_CIRCUIT(long, stat_target(context, target));

            *SHORT_CIRCUIT(long, statbuf.get_as_mut()) = kstat.to_stat();
            return io::Result<long>::ok(0);
        }

        io::Result<long> _fstat(const ProcessContext &context, int fd, UserPtr<abi::Stat> statbuf)
        {
            logging::debug("sys_fstat <= fd: {}", fd);

            auto file = SHORT_CIRCUIT(long, get_file_like(context, fd));
            auto kstat = SHORT_CIRCUIT(long, file->stat());

            *SHORT_CIRCUIT(long, statbuf.get_as_mut()) = kstat.to_stat();
            return io::Result<long>::ok(0);
        }

        io::Result<long> _lstat(UserConstPtr<char> path, UserPtr<abi::Stat> statbuf)
        {
            auto str = SHORT_CIRCUIT(long, path.get_as_str());
            logging::debug("sys_lstat <= path: \"{}\"", str);

            // TODO: report the link itself once the filesystem layer can open symlinks without following them.
            *SHORT_CIRCUIT(long, statbuf.get_as_mut()) = abi::Stat{};
            return io::Result<long>::ok(0);
        }

        io::Result<long> _fstatat(const ProcessContext &context, int dirfd, UserConstPtr<char> path, UserPtr<abi::Stat> statbuf, uint32_t flags)
        {
            auto str = SHORT_CIRCUIT(long, path.get_as_str_nullable());
            logging::debug("sys_fstatat <= dirfd: {}, path: {}, flags: {:#x}", dirfd, _format_path(str), flags);

            auto target = SHORT_CIRCUIT(long, classify_target(dirfd, str, flags));
            auto kstat = SHORT_CIRCUIT(long, stat_target(context, target));

            *SHORT_CIRCUIT(long, statbuf.get_as_mut()) = kstat.to_stat();
            return io::Result<long>::ok(0);
        }

        io::Result<long> _statx(const ProcessContext &context, int dirfd, UserConstPtr<char> path, uint32_t flags, uint32_t mask, UserPtr<abi::Statx> statxbuf)
        {
            auto str = SHORT_CIRCUIT(long, path.get_as_str_nullable());
            logging::debug("sys_statx <= dirfd: {}, path: {}, flags: {:#x}, mask: {:#x}", dirfd, _format_path(str), flags, mask);

            auto target = SHORT_CIRCUIT(long, classify_target(dirfd, str, flags));
            auto kstat = SHORT_CIRCUIT(long, stat_target(context, target));

            *SHORT_CIRCUIT(long, statxbuf.get_as_mut()) = kstat.to_statx();
            return io::Result<long>::ok(0);
        }

        io::Result<long> _statfs(UserConstPtr<char> path, UserPtr<abi::Statfs> statfsbuf)
        {
            auto str = SHORT_CIRCUIT(long, path.get_as_str());
            logging::debug("sys_statfs <= path: \"{}\"", str);

            // TODO: ask the filesystem for real numbers instead of this fixed geometry.
            abi::Statfs statfs = {};
            statfs.f_bsize = 4096;
            statfs.f_blocks = 1024;
            statfs.f_bfree = 512;
            statfs.f_bavail = 256;
            statfs.f_files = 1024;
            statfs.f_ffree = 512;
            statfs.f_namelen = 255;

            *SHORT_CIRCUIT(long, statfsbuf.get_as_mut()) = statfs;
            return io::Result<long>::ok(0);
        }
    }

    long sys_stat(const ProcessContext &context, UserConstPtr<char> path, UserPtr<abi::Stat> statbuf)
    {
        return to_syscall_return("sys_stat", _stat(context, path, statbuf));
    }

    long sys_fstat(const ProcessContext &context, int fd, UserPtr<abi::Stat> statbuf)
    {
        return to_syscall_return("sys_fstat", _fstat(context, fd, statbuf));
    }

    long sys_lstat(const ProcessContext &, UserConstPtr<char> path, UserPtr<abi::Stat> statbuf)
    {
        return to_syscall_return("sys_lstat", _lstat(path, statbuf));
    }

    long sys_fstatat(const ProcessContext &context, int dirfd, UserConstPtr<char> path, UserPtr<abi::Stat> statbuf, uint32_t flags)
    {
        return to_syscall_return("sys_fstatat", _fstatat(context, dirfd, path, statbuf, flags));
    }

    long sys_statx(const ProcessContext &context, int dirfd, UserConstPtr<char> path, uint32_t flags, uint32_t mask, UserPtr<abi::Statx> statxbuf)
    {
        return to_syscall_return("sys_statx", _statx(context, dirfd, path, flags, mask, statxbuf));
    }

    long sys_statfs(const ProcessContext &, UserConstPtr<char> path, UserPtr<abi::Statfs> statfsbuf)
    {
        return to_syscall_return("sys_statfs", _statfs(path, statfsbuf));
    }
}
