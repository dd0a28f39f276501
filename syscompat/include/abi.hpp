#pragma once

#include "pch.hpp"

/**
 * @brief Binary layouts of the structures the Linux kernel writes into user memory.
 *
 * Field order, widths and padding mirror the kernel UAPI headers, so these structures can be
 * handed to unmodified Linux binaries. Timestamp fields carry a `_sec` suffix because glibc
 * reserves `st_atime` and friends as macros.
 */
namespace syscompat::abi
{
#if defined(__x86_64__)
    /** @brief `struct stat` from `arch/x86/include/uapi/asm/stat.h` (64-bit). */
    struct Stat
    {
        uint64_t st_dev;
        uint64_t st_ino;
        uint64_t st_nlink;
        uint32_t st_mode;
        uint32_t st_uid;
        uint32_t st_gid;
        uint32_t pad0;
        uint64_t st_rdev;
        int64_t st_size;
        int64_t st_blksize;
        int64_t st_blocks;
        uint64_t st_atime_sec;
        uint64_t st_atime_nsec;
        uint64_t st_mtime_sec;
        uint64_t st_mtime_nsec;
        uint64_t st_ctime_sec;
        uint64_t st_ctime_nsec;
        int64_t unused[3];
    };

    static_assert(sizeof(Stat) == 144);
#else
    /** @brief `struct stat` from `include/uapi/asm-generic/stat.h` (riscv64, aarch64, loongarch64). */
    struct Stat
    {
        uint64_t st_dev;
        uint64_t st_ino;
        uint32_t st_mode;
        uint32_t st_nlink;
        uint32_t st_uid;
        uint32_t st_gid;
        uint64_t st_rdev;
        uint64_t pad1;
        int64_t st_size;
        int32_t st_blksize;
        int32_t pad2;
        int64_t st_blocks;
        int64_t st_atime_sec;
        uint64_t st_atime_nsec;
        int64_t st_mtime_sec;
        uint64_t st_mtime_nsec;
        int64_t st_ctime_sec;
        uint64_t st_ctime_nsec;
        uint32_t unused4;
        uint32_t unused5;
    };

    static_assert(sizeof(Stat) == 128);
#endif

    /** @brief `struct statx_timestamp` from `include/uapi/linux/stat.h`. */
    struct StatxTimestamp
    {
        int64_t tv_sec;
        uint32_t tv_nsec;
        int32_t reserved;
    };

    static_assert(sizeof(StatxTimestamp) == 16);

    /** @brief `struct statx` from `include/uapi/linux/stat.h`. */
    struct Statx
    {
        uint32_t stx_mask;
        uint32_t stx_blksize;
        uint64_t stx_attributes;
        uint32_t stx_nlink;
        uint32_t stx_uid;
        uint32_t stx_gid;
        uint16_t stx_mode;
        uint16_t spare0;
        uint64_t stx_ino;
        uint64_t stx_size;
        uint64_t stx_blocks;
        uint64_t stx_attributes_mask;
        StatxTimestamp stx_atime;
        StatxTimestamp stx_btime;
        StatxTimestamp stx_ctime;
        StatxTimestamp stx_mtime;
        uint32_t stx_rdev_major;
        uint32_t stx_rdev_minor;
        uint32_t stx_dev_major;
        uint32_t stx_dev_minor;
        uint64_t stx_mnt_id;
        uint32_t stx_dio_mem_align;
        uint32_t stx_dio_offset_align;
        uint64_t spare3[12];
    };

    static_assert(sizeof(Statx) == 256);

    /** @brief `__kernel_fsid_t` */
    struct Fsid
    {
        int32_t val[2];
    };

    /** @brief `struct statfs` with 64-bit `__statfs_word` (x86_64 and asm-generic alike). */
    struct Statfs
    {
        int64_t f_type;
        int64_t f_bsize;
        int64_t f_blocks;
        int64_t f_bfree;
        int64_t f_bavail;
        int64_t f_files;
        int64_t f_ffree;
        Fsid f_fsid;
        int64_t f_namelen;
        int64_t f_frsize;
        int64_t f_flags;
        int64_t f_spare[4];
    };

    static_assert(sizeof(Statfs) == 120);
}
