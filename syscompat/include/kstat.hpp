#pragma once

#include "abi.hpp"
#include "fs.hpp"

namespace syscompat
{
    /**
     * @brief Kind-independent metadata record of a filesystem object.
     *
     * Every ABI structure handed to callers (@ref abi::Stat, @ref abi::Statx) is a projection of this record.
     */
    struct Kstat
    {
        uint64_t dev = 0;
        uint64_t ino = 0;
        uint32_t mode = 0;
        uint32_t nlink = 0;
        uint32_t uid = 0;
        uint32_t gid = 0;
        uint64_t rdev = 0;
        uint64_t size = 0;
        uint32_t blksize = 0;
        uint64_t blocks = 0;
        struct timespec atime = {};
        struct timespec mtime = {};
        struct timespec ctime = {};

        static Kstat from_metadata(const fs::Metadata &metadata);

        abi::Stat to_stat() const;

        /** @brief `stx_mask` and the attribute fields stay zero, `btime` is not tracked. */
        abi::Statx to_statx() const;
    };
}
