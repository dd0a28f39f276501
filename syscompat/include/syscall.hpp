#pragma once

#include <array>

#include <sys/syscall.h>

#include "context.hpp"

namespace syscompat
{
    /** @brief Host Linux syscall numbers of the calls this layer implements. */
    enum class Sysno : long
    {
#ifdef SYS_stat
        Stat = SYS_stat,
#endif
#ifdef SYS_lstat
        Lstat = SYS_lstat,
#endif
        Fstat = SYS_fstat,
        Fstatat = SYS_newfstatat,
        Statx = SYS_statx,
        Statfs = SYS_statfs,
    };

    /** @brief The six raw argument registers of a syscall. */
    using SyscallArgs = std::array<uint64_t, 6>;

    /**
     * @brief Decodes `args` for `sysno` and runs the matching entry point.
     *
     * Returns the syscall result, or `-ENOSYS` for a number this layer does not implement.
     */
    long handle_syscall(const ProcessContext &context, long sysno, const SyscallArgs &args);
}
