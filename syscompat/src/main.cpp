#include "config.hpp"
#include "stat.hpp"

namespace
{
    int _show_help()
    {
        std::cout << "Usage: syscompat-stat [--config FILE] COMMAND ARGS..." << std::endl;
        std::cout << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  stat PATH" << std::endl;
        std::cout << "  lstat PATH" << std::endl;
        std::cout << "  fstat FD" << std::endl;
        std::cout << "  fstatat DIRFD PATH [--empty-path]" << std::endl;
        std::cout << "  statx DIRFD PATH [--empty-path]" << std::endl;
        std::cout << "  statfs PATH" << std::endl;
        std::cout << std::endl;
        std::cout << "DIRFD is a descriptor number or \"cwd\"." << std::endl;
        return 1;
    }

    std::optional<int> _parse_fd(const char *arg)
    {
        if (std::strcmp(arg, "cwd") == 0)
        {
            return AT_FDCWD;
        }

        try
        {
            size_t pos = 0;
            int fd = std::stoi(arg, &pos);
            if (pos != std::strlen(arg))
            {
                return std::nullopt;
            }

            return fd;
        }
        catch (const std::logic_error &)
        {
            return std::nullopt;
        }
    }

    io::Result<syscompat::Config> _load_config(const std::optional<path::PathBuf> &explicit_path)
    {
        if (explicit_path.has_value())
        {
            return syscompat::load_config(*explicit_path);
        }

        auto result = syscompat::load_config(syscompat::default_config_path());
        if (result.is_err() && result.unwrap_err().kind() == io::ErrorKind::NotFound)
        {
            // Without a configuration file the host itself is mounted.
            std::error_code ec;
            auto cwd = std::filesystem::current_path(ec);

            syscompat::Config config;
            config.root = "/";
            config.cwd = ec ? "/" : cwd.string();
            return io::Result<syscompat::Config>::ok(std::move(config));
        }

        return result;
    }

    void _print_stat(const syscompat::abi::Stat &st)
    {
        std::cout << "dev: " << st.st_dev << std::endl;
        std::cout << "ino: " << st.st_ino << std::endl;
        std::cout << "mode: " << std::format("{:#o}", st.st_mode) << std::endl;
        std::cout << "nlink: " << st.st_nlink << std::endl;
        std::cout << "uid: " << st.st_uid << std::endl;
        std::cout << "gid: " << st.st_gid << std::endl;
        std::cout << "rdev: " << st.st_rdev << std::endl;
        std::cout << "size: " << st.st_size << std::endl;
        std::cout << "blksize: " << st.st_blksize << std::endl;
        std::cout << "blocks: " << st.st_blocks << std::endl;
        std::cout << "atime: " << st.st_atime_sec << "." << std::format("{:09}", st.st_atime_nsec) << std::endl;
        std::cout << "mtime: " << st.st_mtime_sec << "." << std::format("{:09}", st.st_mtime_nsec) << std::endl;
        std::cout << "ctime: " << st.st_ctime_sec << "." << std::format("{:09}", st.st_ctime_nsec) << std::endl;
    }

    void _print_statx(const syscompat::abi::Statx &stx)
    {
        std::cout << "mask: " << std::format("{:#x}", stx.stx_mask) << std::endl;
        std::cout << "dev: " << stx.stx_dev_major << ":" << stx.stx_dev_minor << std::endl;
        std::cout << "ino: " << stx.stx_ino << std::endl;
        std::cout << "mode: " << std::format("{:#o}", stx.stx_mode) << std::endl;
        std::cout << "nlink: " << stx.stx_nlink << std::endl;
        std::cout << "uid: " << stx.stx_uid << std::endl;
        std::cout << "gid: " << stx.stx_gid << std::endl;
        std::cout << "rdev: " << stx.stx_rdev_major << ":" << stx.stx_rdev_minor << std::endl;
        std::cout << "size: " << stx.stx_size << std::endl;
        std::cout << "blksize: " << stx.stx_blksize << std::endl;
        std::cout << "blocks: " << stx.stx_blocks << std::endl;
        std::cout << "atime: " << stx.stx_atime.tv_sec << "." << std::format("{:09}", stx.stx_atime.tv_nsec) << std::endl;
        std::cout << "mtime: " << stx.stx_mtime.tv_sec << "." << std::format("{:09}", stx.stx_mtime.tv_nsec) << std::endl;
        std::cout << "ctime: " << stx.stx_ctime.tv_sec << "." << std::format("{:09}", stx.stx_ctime.tv_nsec) << std::endl;
    }

    void _print_statfs(const syscompat::abi::Statfs &st)
    {
        std::cout << "type: " << std::format("{:#x}", st.f_type) << std::endl;
        std::cout << "bsize: " << st.f_bsize << std::endl;
        std::cout << "blocks: " << st.f_blocks << std::endl;
        std::cout << "bfree: " << st.f_bfree << std::endl;
        std::cout << "bavail: " << st.f_bavail << std::endl;
        std::cout << "files: " << st.f_files << std::endl;
        std::cout << "ffree: " << st.f_ffree << std::endl;
        std::cout << "namelen: " << st.f_namelen << std::endl;
    }

    int _report(const char *command, long ret)
    {
        if (ret < 0)
        {
            auto error = io::Error::from_raw_os_error(static_cast<int>(-ret));
            std::cerr << command << ": " << error.message() << std::endl;
            return 1;
        }

        return 0;
    }
}

int main(int argc, char **argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);

    std::optional<path::PathBuf> config_path;
    if (args.size() >= 2 && args[0] == "--config")
    {
        config_path = path::PathBuf(args[1]);
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty())
    {
        return _show_help();
    }

    auto config_result = _load_config(config_path);
    if (config_result.is_err())
    {
        std::cerr << "Unable to load configuration: " << config_result.unwrap_err().message() << std::endl;
        return 1;
    }

    auto config = std::move(config_result).into_ok();
    syscompat::logging::initialize_logger(config.log_level);

    auto context_result = syscompat::build_context(config);
    if (context_result.is_err())
    {
        std::cerr << "Unable to set up process context: " << context_result.unwrap_err().message() << std::endl;
        return 1;
    }

    auto context = std::move(context_result).into_ok();

    using syscompat::UserConstPtr;
    using syscompat::UserPtr;

    const auto &command = args[0];
    if ((command == "stat" || command == "lstat") && args.size() == 2)
    {
        syscompat::abi::Stat st = {};
        auto path = UserConstPtr<char>(args[1].c_str());
        auto ret = command == "stat"
                       ? syscompat::sys_stat(*context, path, UserPtr(&st))
                       : syscompat::sys_lstat(*context, path, UserPtr(&st));
        if (ret == 0)
        {
            _print_stat(st);
        }

        return _report(command.c_str(), ret);
    }

    if (command == "fstat" && args.size() == 2)
    {
        auto fd = _parse_fd(args[1].c_str());
        if (!fd.has_value() || *fd == AT_FDCWD)
        {
            return _show_help();
        }

        syscompat::abi::Stat st = {};
        auto ret = syscompat::sys_fstat(*context, *fd, UserPtr(&st));
        if (ret == 0)
        {
            _print_stat(st);
        }

        return _report(command.c_str(), ret);
    }

    if ((command == "fstatat" || command == "statx") && (args.size() == 3 || args.size() == 4))
    {
        auto dirfd = _parse_fd(args[1].c_str());
        if (!dirfd.has_value())
        {
            return _show_help();
        }

        uint32_t flags = 0;
        if (args.size() == 4)
        {
            if (args[3] != "--empty-path")
            {
                return _show_help();
            }

            flags |= AT_EMPTY_PATH;
        }

        auto path = UserConstPtr<char>(args[2].c_str());
        if (command == "fstatat")
        {
            syscompat::abi::Stat st = {};
            auto ret = syscompat::sys_fstatat(*context, *dirfd, path, UserPtr(&st), flags);
            if (ret == 0)
            {
                _print_stat(st);
            }

            return _report(command.c_str(), ret);
        }

        syscompat::abi::Statx stx = {};
        auto ret = syscompat::sys_statx(*context, *dirfd, path, flags, 0, UserPtr(&stx));
        if (ret == 0)
        {
            _print_statx(stx);
        }

        return _report(command.c_str(), ret);
    }

    if (command == "statfs" && args.size() == 2)
    {
        syscompat::abi::Statfs st = {};
        auto ret = syscompat::sys_statfs(*context, UserConstPtr<char>(args[1].c_str()), UserPtr(&st));
        if (ret == 0)
        {
            _print_statfs(st);
        }

        return _report(command.c_str(), ret);
    }

    return _show_help();
}
