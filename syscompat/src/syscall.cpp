#include "syscall.hpp"
#include "logging.hpp"
#include "stat.hpp"

namespace
{
    int _as_fd(uint64_t arg)
    {
        return static_cast<int>(static_cast<int64_t>(arg));
    }

    uint32_t _as_u32(uint64_t arg)
    {
        return static_cast<uint32_t>(arg);
    }
}

namespace syscompat
{
    long handle_syscall(const ProcessContext &context, long sysno, const SyscallArgs &args)
    {
        using abi::Stat;
        using abi::Statfs;
        using abi::Statx;

        switch (static_cast<Sysno>(sysno))
        {
#ifdef SYS_stat
        case Sysno::Stat:
            return sys_stat(context, UserConstPtr<char>::from_raw(args[0]), UserPtr<Stat>::from_raw(args[1]));
#endif
#ifdef SYS_lstat
        case Sysno::Lstat:
            return sys_lstat(context, UserConstPtr<char>::from_raw(args[0]), UserPtr<Stat>::from_raw(args[1]));
#endif
        case Sysno::Fstat:
            return sys_fstat(context, _as_fd(args[0]), UserPtr<Stat>::from_raw(args[1]));
        case Sysno::Fstatat:
            return sys_fstatat(
                context,
                _as_fd(args[0]),
                UserConstPtr<char>::from_raw(args[1]),
                UserPtr<Stat>::from_raw(args[2]),
                _as_u32(args[3]));
        case Sysno::Statx:
            return sys_statx(
                context,
                _as_fd(args[0]),
                UserConstPtr<char>::from_raw(args[1]),
                _as_u32(args[2]),
                _as_u32(args[3]),
                UserPtr<Statx>::from_raw(args[4]));
        case Sysno::Statfs:
            return sys_statfs(context, UserConstPtr<char>::from_raw(args[0]), UserPtr<Statfs>::from_raw(args[1]));
        default:
            logging::warn("unimplemented syscall {}", sysno);
            return -ENOSYS;
        }
    }
}
