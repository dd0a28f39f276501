#pragma once

#include "abi.hpp"
#include "context.hpp"
#include "user_ptr.hpp"

namespace syscompat
{
    /** @brief The path names an object on its own. */
    struct AbsolutePath
    {
        std::string_view path;
    };

    /** @brief The path is relative to the working directory (`dirfd == AT_FDCWD`). */
    struct CwdRelativePath
    {
        std::string_view path;
    };

    /** @brief The path is relative to the directory open at `dirfd`. */
    struct FdRelativePath
    {
        int dirfd;
        std::string_view path;
    };

    /** @brief Empty path with `AT_EMPTY_PATH`: the object is the one open at `fd`. */
    struct FdOnly
    {
        int fd;
    };

    /** @brief Which object a `*at` style call addresses. Exactly one alternative applies per call. */
    using ResolutionTarget = std::variant<AbsolutePath, CwdRelativePath, FdRelativePath, FdOnly>;

    /**
     * @brief Picks the addressing mode of a `(dirfd, path, flags)` triple.
     *
     * An absent or empty path fails with `ENOENT` unless `AT_EMPTY_PATH` is set; the descriptor is
     * not looked at in that case.
     */
    io::Result<ResolutionTarget> classify_target(int dirfd, std::optional<std::string_view> path, uint32_t flags);

    /** @brief The result of @ref open_and_classify: whichever handle the path could be opened as. */
    using OpenedObject = std::variant<std::unique_ptr<vfs::File>, std::unique_ptr<vfs::Directory>>;

    /**
     * @brief Opens `path` without knowing in advance whether it is a file or a directory.
     *
     * A read-only, non-blocking file open is tried first. Only an @ref io::ErrorKind::IsADirectory failure leads to a
     * second attempt as a directory; every other error is returned as is.
     */
    io::Result<OpenedObject> open_and_classify(vfs::FileSystem &filesystem, const path::PathBuf &path);

    /** @brief Metadata of the object at an absolute `path`; the transient handle is closed before returning. */
    io::Result<Kstat> stat_at_path(vfs::FileSystem &filesystem, const path::PathBuf &path);

    io::Result<Kstat> stat_target(const ProcessContext &context, const ResolutionTarget &target);

    /** @brief Converts a syscall outcome to the kernel return convention: the value, or a negated errno. */
    long to_syscall_return(const char *name, io::Result<long> &&result);

    /**
     * @brief Get the file metadata by `path` and write into `statbuf`.
     *
     * Return 0 if success.
     */
    long sys_stat(const ProcessContext &context, UserConstPtr<char> path, UserPtr<abi::Stat> statbuf);

    /**
     * @brief Get file metadata by `fd` and write into `statbuf`.
     *
     * Return 0 if success.
     */
    long sys_fstat(const ProcessContext &context, int fd, UserPtr<abi::Stat> statbuf);

    /**
     * @brief Get the metadata of the symbolic link and write into `statbuf`.
     *
     * Symbolic links are not modeled yet: the path is validated and `statbuf` is zero-filled.
     */
    long sys_lstat(const ProcessContext &context, UserConstPtr<char> path, UserPtr<abi::Stat> statbuf);

    long sys_fstatat(const ProcessContext &context, int dirfd, UserConstPtr<char> path, UserPtr<abi::Stat> statbuf, uint32_t flags);

    /** @brief `mask` is accepted and ignored, every available field is always filled. */
    long sys_statx(const ProcessContext &context, int dirfd, UserConstPtr<char> path, uint32_t flags, uint32_t mask, UserPtr<abi::Statx> statxbuf);

    /** @brief Reports fixed filesystem statistics whatever `path` names, as long as it is readable. */
    long sys_statfs(const ProcessContext &context, UserConstPtr<char> path, UserPtr<abi::Statfs> statfsbuf);
}
