#include <algorithm>

#include <gtest/gtest.h>

#include "fake_file.hpp"
#include "rootfs.hpp"
#include "stat.hpp"

using namespace syscompat;

namespace
{
    constexpr unsigned char POISON = 0xAB;

    template <typename T>
    T poisoned()
    {
        T value;
        std::memset(&value, POISON, sizeof(T));
        return value;
    }

    template <typename T>
    bool is_poisoned(const T &value)
    {
        const auto *bytes = reinterpret_cast<const unsigned char *>(&value);
        return std::all_of(bytes, bytes + sizeof(T), [](unsigned char b)
                           { return b == POISON; });
    }

    template <typename T>
    bool is_zeroed(const T &value)
    {
        const auto *bytes = reinterpret_cast<const unsigned char *>(&value);
        return std::all_of(bytes, bytes + sizeof(T), [](unsigned char b)
                           { return b == 0; });
    }

    UserConstPtr<char> user_str(const char *str)
    {
        return UserConstPtr<char>(str);
    }

    void expect_same_object(const syscompat::abi::Stat &actual, const struct stat &expected)
    {
        EXPECT_EQ(actual.st_dev, expected.st_dev);
        EXPECT_EQ(actual.st_ino, expected.st_ino);
        EXPECT_EQ(actual.st_mode, expected.st_mode);
        EXPECT_EQ(actual.st_nlink, expected.st_nlink);
        EXPECT_EQ(actual.st_uid, expected.st_uid);
        EXPECT_EQ(actual.st_gid, expected.st_gid);
        EXPECT_EQ(actual.st_size, expected.st_size);
        EXPECT_EQ(actual.st_blocks, expected.st_blocks);
        EXPECT_EQ(actual.st_mtime_sec, expected.st_mtim.tv_sec);
        EXPECT_EQ(actual.st_mtime_nsec, expected.st_mtim.tv_nsec);
    }
}

class StatSyscall : public RootFsTest
{
};

TEST_F(StatSyscall, AbsolutePath)
{
    syscompat::abi::Stat st = {};
    ASSERT_EQ(sys_stat(*context, user_str("/hello.txt"), UserPtr(&st)), 0);
    expect_same_object(st, host_stat("hello.txt"));
    ASSERT_TRUE(S_ISREG(st.st_mode));
    ASSERT_EQ(st.st_size, 12);
}

TEST_F(StatSyscall, RelativeToWorkingDirectory)
{
    syscompat::abi::Stat st = {};
    ASSERT_EQ(sys_stat(*context, user_str("notes.txt"), UserPtr(&st)), 0);
    expect_same_object(st, host_stat("home/user/notes.txt"));

    syscompat::abi::Stat dot = {};
    ASSERT_EQ(sys_stat(*context, user_str("."), UserPtr(&dot)), 0);
    expect_same_object(dot, host_stat("home/user"));
}

TEST_F(StatSyscall, Directory)
{
    syscompat::abi::Stat st = {};
    ASSERT_EQ(sys_stat(*context, user_str("/a/b"), UserPtr(&st)), 0);
    expect_same_object(st, host_stat("a/b"));
    ASSERT_TRUE(S_ISDIR(st.st_mode));

    syscompat::abi::Stat root_st = {};
    ASSERT_EQ(sys_stat(*context, user_str("/"), UserPtr(&root_st)), 0);
    ASSERT_EQ(root_st.st_ino, host_stat("").st_ino);
}

TEST_F(StatSyscall, MissingPathLeavesBufferUntouched)
{
    auto st = poisoned<syscompat::abi::Stat>();
    ASSERT_EQ(sys_stat(*context, user_str("/a/b/missing.txt"), UserPtr(&st)), -ENOENT);
    ASSERT_TRUE(is_poisoned(st));

    ASSERT_EQ(sys_stat(*context, user_str("/hello.txt/child"), UserPtr(&st)), -ENOTDIR);
    ASSERT_TRUE(is_poisoned(st));
}

TEST_F(StatSyscall, EmptyPath)
{
    auto st = poisoned<syscompat::abi::Stat>();
    ASSERT_EQ(sys_stat(*context, user_str(""), UserPtr(&st)), -ENOENT);
    ASSERT_TRUE(is_poisoned(st));
}

TEST_F(StatSyscall, BadPointers)
{
    syscompat::abi::Stat st = {};
    ASSERT_EQ(sys_stat(*context, UserConstPtr<char>(nullptr), UserPtr(&st)), -EFAULT);
    ASSERT_EQ(sys_stat(*context, user_str("/hello.txt"), UserPtr<syscompat::abi::Stat>(nullptr)), -EFAULT);

    // Resolution runs before the output buffer is looked at.
    ASSERT_EQ(sys_stat(*context, user_str("/missing"), UserPtr<syscompat::abi::Stat>(nullptr)), -ENOENT);

    alignas(syscompat::abi::Stat) unsigned char storage[sizeof(syscompat::abi::Stat) + 1];
    auto misaligned = UserPtr(reinterpret_cast<syscompat::abi::Stat *>(storage + 1));
    ASSERT_EQ(sys_stat(*context, user_str("/hello.txt"), misaligned), -EFAULT);
}

TEST_F(StatSyscall, PathTooLong)
{
    std::string name(PATH_MAX + 16, 'x');

    syscompat::abi::Stat st = {};
    ASSERT_EQ(sys_stat(*context, user_str(name.c_str()), UserPtr(&st)), -ENAMETOOLONG);
}

TEST_F(StatSyscall, NamedPipeWithoutWriter)
{
    ASSERT_EQ(::mkfifo((root / "a" / "pipe").c_str(), 0644), 0);

    syscompat::abi::Stat st = {};
    ASSERT_EQ(sys_stat(*context, user_str("/a/pipe"), UserPtr(&st)), 0);
    expect_same_object(st, host_stat("a/pipe"));
    ASSERT_TRUE(S_ISFIFO(st.st_mode));

    syscompat::abi::Statx stx = {};
    ASSERT_EQ(sys_statx(*context, AT_FDCWD, user_str("/a/pipe"), 0, 0, UserPtr(&stx)), 0);
    ASSERT_TRUE(S_ISFIFO(stx.stx_mode));
}

TEST_F(StatSyscall, SymlinkInsideRootIsFollowed)
{
    ASSERT_EQ(::symlink("b/subdir/file.txt", (root / "a" / "link").c_str()), 0);

    syscompat::abi::Stat st = {};
    ASSERT_EQ(sys_stat(*context, user_str("/a/link"), UserPtr(&st)), 0);
    expect_same_object(st, host_stat("a/b/subdir/file.txt"));
}

class FstatSyscall : public RootFsTest
{
};

TEST_F(FstatSyscall, FileDescriptor)
{
    int fd = open_file_fd("/a/b/subdir/file.txt");

    syscompat::abi::Stat st = {};
    ASSERT_EQ(sys_fstat(*context, fd, UserPtr(&st)), 0);
    expect_same_object(st, host_stat("a/b/subdir/file.txt"));
}

TEST_F(FstatSyscall, DirectoryDescriptor)
{
    int fd = open_dir_fd("/a/b/empty");

    syscompat::abi::Stat st = {};
    ASSERT_EQ(sys_fstat(*context, fd, UserPtr(&st)), 0);
    expect_same_object(st, host_stat("a/b/empty"));
}

TEST_F(FstatSyscall, ArbitraryFileLike)
{
    ASSERT_TRUE(context->fd_table().add_at(9, std::make_shared<FakeFileLike>(31337)).is_ok());

    syscompat::abi::Stat st = {};
    ASSERT_EQ(sys_fstat(*context, 9, UserPtr(&st)), 0);
    ASSERT_EQ(st.st_ino, 31337u);
    ASSERT_TRUE(S_ISFIFO(st.st_mode));
}

TEST_F(FstatSyscall, BadDescriptor)
{
    auto st = poisoned<syscompat::abi::Stat>();
    for (int fd : {0, 100, -1, AT_FDCWD})
    {
        ASSERT_EQ(sys_fstat(*context, fd, UserPtr(&st)), -EBADF);
    }
    ASSERT_TRUE(is_poisoned(st));
}

class FstatatSyscall : public RootFsTest
{
};

TEST_F(FstatatSyscall, DescriptorRelativeEqualsAbsolute)
{
    int dirfd = open_dir_fd("/a/b");

    syscompat::abi::Stat relative = {};
    ASSERT_EQ(sys_fstatat(*context, dirfd, user_str("subdir/file.txt"), UserPtr(&relative), 0), 0);

    syscompat::abi::Stat absolute = {};
    ASSERT_EQ(sys_stat(*context, user_str("/a/b/subdir/file.txt"), UserPtr(&absolute)), 0);

    ASSERT_EQ(std::memcmp(&relative, &absolute, sizeof(syscompat::abi::Stat)), 0);
}

TEST_F(FstatatSyscall, WorkingDirectoryEqualsStat)
{
    syscompat::abi::Stat at = {};
    ASSERT_EQ(sys_fstatat(*context, AT_FDCWD, user_str("notes.txt"), UserPtr(&at), 0), 0);

    syscompat::abi::Stat plain = {};
    ASSERT_EQ(sys_stat(*context, user_str("notes.txt"), UserPtr(&plain)), 0);

    ASSERT_EQ(std::memcmp(&at, &plain, sizeof(syscompat::abi::Stat)), 0);
}

TEST_F(FstatatSyscall, AbsolutePathIgnoresDescriptor)
{
    int fd = open_file_fd("/hello.txt");

    for (int dirfd : {AT_FDCWD, fd, 500, -9})
    {
        syscompat::abi::Stat st = {};
        ASSERT_EQ(sys_fstatat(*context, dirfd, user_str("/a/b/subdir/file.txt"), UserPtr(&st), 0), 0);
        expect_same_object(st, host_stat("a/b/subdir/file.txt"));
    }
}

TEST_F(FstatatSyscall, EmptyPathEqualsFstat)
{
    int fd = open_file_fd("/hello.txt");

    syscompat::abi::Stat at = {};
    ASSERT_EQ(sys_fstatat(*context, fd, user_str(""), UserPtr(&at), AT_EMPTY_PATH), 0);

    syscompat::abi::Stat plain = {};
    ASSERT_EQ(sys_fstat(*context, fd, UserPtr(&plain)), 0);

    ASSERT_EQ(std::memcmp(&at, &plain, sizeof(syscompat::abi::Stat)), 0);

    syscompat::abi::Stat null_path = {};
    ASSERT_EQ(sys_fstatat(*context, fd, UserConstPtr<char>(nullptr), UserPtr(&null_path), AT_EMPTY_PATH), 0);
    ASSERT_EQ(std::memcmp(&null_path, &plain, sizeof(syscompat::abi::Stat)), 0);
}

TEST_F(FstatatSyscall, EmptyPathWithoutFlag)
{
    int fd = open_file_fd("/hello.txt");

    auto st = poisoned<syscompat::abi::Stat>();
    for (int dirfd : {fd, AT_FDCWD, 777})
    {
        ASSERT_EQ(sys_fstatat(*context, dirfd, user_str(""), UserPtr(&st), 0), -ENOENT);
        ASSERT_EQ(sys_fstatat(*context, dirfd, UserConstPtr<char>(nullptr), UserPtr(&st), 0), -ENOENT);
    }
    ASSERT_TRUE(is_poisoned(st));
}

TEST_F(FstatatSyscall, EmptyPathAtWorkingDirectory)
{
    // AT_FDCWD has no descriptor table entry.
    auto st = poisoned<syscompat::abi::Stat>();
    ASSERT_EQ(sys_fstatat(*context, AT_FDCWD, user_str(""), UserPtr(&st), AT_EMPTY_PATH), -EBADF);
    ASSERT_TRUE(is_poisoned(st));
}

TEST_F(FstatatSyscall, DescriptorErrors)
{
    int fd = open_file_fd("/hello.txt");

    syscompat::abi::Stat st = {};
    ASSERT_EQ(sys_fstatat(*context, fd, user_str("file.txt"), UserPtr(&st), 0), -ENOTDIR);
    ASSERT_EQ(sys_fstatat(*context, 321, user_str("file.txt"), UserPtr(&st), 0), -EBADF);

    int dirfd = open_dir_fd("/a/b");
    ASSERT_EQ(sys_fstatat(*context, dirfd, user_str("nothing"), UserPtr(&st), 0), -ENOENT);
}

class StatxSyscall : public RootFsTest
{
};

TEST_F(StatxSyscall, MatchesStat)
{
    int dirfd = open_dir_fd("/a");

    syscompat::abi::Statx stx = {};
    ASSERT_EQ(sys_statx(*context, dirfd, user_str("b/subdir/file.txt"), 0, 0, UserPtr(&stx)), 0);

    auto expected = host_stat("a/b/subdir/file.txt");
    ASSERT_EQ(stx.stx_mask, 0u);
    ASSERT_EQ(stx.stx_ino, expected.st_ino);
    ASSERT_EQ(stx.stx_size, static_cast<uint64_t>(expected.st_size));
    ASSERT_EQ(stx.stx_mode, expected.st_mode & 0xFFFF);
    ASSERT_EQ(stx.stx_nlink, expected.st_nlink);
    ASSERT_EQ(stx.stx_dev_major, major(expected.st_dev));
    ASSERT_EQ(stx.stx_dev_minor, minor(expected.st_dev));
    ASSERT_EQ(stx.stx_mtime.tv_sec, expected.st_mtim.tv_sec);
    ASSERT_EQ(stx.stx_mtime.tv_nsec, static_cast<uint32_t>(expected.st_mtim.tv_nsec));
}

TEST_F(StatxSyscall, MaskIsIgnored)
{
    syscompat::abi::Statx basic = {};
    ASSERT_EQ(sys_statx(*context, AT_FDCWD, user_str("/hello.txt"), 0, STATX_BASIC_STATS, UserPtr(&basic)), 0);

    syscompat::abi::Statx none = {};
    ASSERT_EQ(sys_statx(*context, AT_FDCWD, user_str("/hello.txt"), 0, 0, UserPtr(&none)), 0);

    ASSERT_EQ(std::memcmp(&basic, &none, sizeof(syscompat::abi::Statx)), 0);
}

TEST_F(StatxSyscall, EmptyPath)
{
    int fd = open_dir_fd("/a/b/empty");

    syscompat::abi::Statx stx = {};
    ASSERT_EQ(sys_statx(*context, fd, user_str(""), AT_EMPTY_PATH, 0, UserPtr(&stx)), 0);
    ASSERT_EQ(stx.stx_ino, host_stat("a/b/empty").st_ino);

    auto untouched = poisoned<syscompat::abi::Statx>();
    ASSERT_EQ(sys_statx(*context, fd, user_str(""), 0, 0, UserPtr(&untouched)), -ENOENT);
    ASSERT_EQ(sys_statx(*context, AT_FDCWD, user_str(""), AT_EMPTY_PATH, 0, UserPtr(&untouched)), -EBADF);
    ASSERT_TRUE(is_poisoned(untouched));
}

class LstatSyscall : public RootFsTest
{
};

TEST_F(LstatSyscall, ZeroFillsBuffer)
{
    for (const char *path : {"/hello.txt", "/does/not/exist"})
    {
        auto st = poisoned<syscompat::abi::Stat>();
        ASSERT_EQ(sys_lstat(*context, user_str(path), UserPtr(&st)), 0);
        ASSERT_TRUE(is_zeroed(st));
    }
}

TEST_F(LstatSyscall, ValidatesPointers)
{
    syscompat::abi::Stat st = {};
    ASSERT_EQ(sys_lstat(*context, UserConstPtr<char>(nullptr), UserPtr(&st)), -EFAULT);
    ASSERT_EQ(sys_lstat(*context, user_str("/hello.txt"), UserPtr<syscompat::abi::Stat>(nullptr)), -EFAULT);
}

class StatfsSyscall : public RootFsTest
{
};

TEST_F(StatfsSyscall, FixedGeometry)
{
    for (const char *path : {"/", "/hello.txt", "/does/not/exist", ""})
    {
        auto st = poisoned<syscompat::abi::Statfs>();
        ASSERT_EQ(sys_statfs(*context, user_str(path), UserPtr(&st)), 0);
        ASSERT_EQ(st.f_type, 0);
        ASSERT_EQ(st.f_bsize, 4096);
        ASSERT_EQ(st.f_blocks, 1024);
        ASSERT_EQ(st.f_bfree, 512);
        ASSERT_EQ(st.f_bavail, 256);
        ASSERT_EQ(st.f_files, 1024);
        ASSERT_EQ(st.f_ffree, 512);
        ASSERT_EQ(st.f_namelen, 255);
        ASSERT_EQ(st.f_frsize, 0);
        ASSERT_EQ(st.f_fsid.val[0], 0);
    }
}

TEST_F(StatfsSyscall, BadPointers)
{
    syscompat::abi::Statfs st = {};
    ASSERT_EQ(sys_statfs(*context, UserConstPtr<char>(nullptr), UserPtr(&st)), -EFAULT);
    ASSERT_EQ(sys_statfs(*context, user_str("/"), UserPtr<syscompat::abi::Statfs>(nullptr)), -EFAULT);
}

TEST(SyscallReturn, Conversion)
{
    ASSERT_EQ(to_syscall_return("test", io::Result<long>::ok(7)), 7);
    ASSERT_EQ(to_syscall_return("test", io::Result<long>::err(io::Error::from_raw_os_error(EACCES))), -EACCES);

    // Errors without an OS code are encoded from their kind.
    ASSERT_EQ(to_syscall_return("test", io::Result<long>::err(io::Error(io::ErrorKind::InvalidInput, "bad"))), -EINVAL);
    ASSERT_EQ(to_syscall_return("test", io::Result<long>::err(io::Error(io::ErrorKind::IsADirectory, "dir"))), -EISDIR);
}
