#pragma once

#include "io.hpp"
#include "path.hpp"
#include "result.hpp"

#include "linux/fs.hpp"

namespace fs
{
    /**
     * @brief A snapshot of the `stat` record of a filesystem object.
     *
     * Accessor names follow the Unix `MetadataExt` trait and return the raw fields unchanged.
     *
     * @see https://doc.rust-lang.org/std/os/unix/fs/trait.MetadataExt.html
     */
    class Metadata : public NonConstructible
    {
    private:
        _fs_impl::NativeMetadata _inner;

    public:
        explicit Metadata(_fs_impl::NativeMetadata &&inner);

        bool is_dir() const;
        bool is_file() const;
        bool is_symlink() const;

        /** @brief Size in bytes. */
        uint64_t len() const;

        uint64_t dev() const;
        uint64_t ino() const;
        uint32_t mode() const;
        uint64_t nlink() const;
        uint32_t uid() const;
        uint32_t gid() const;
        uint64_t rdev() const;
        uint64_t blksize() const;

        /** @brief Allocated size in 512-byte units. */
        uint64_t blocks() const;

        int64_t atime() const;
        int64_t atime_nsec() const;
        int64_t mtime() const;
        int64_t mtime_nsec() const;
        int64_t ctime() const;
        int64_t ctime_nsec() const;
    };

    /**
     * @brief An open regular file (or anything else `open(2)` accepts without `O_DIRECTORY`).
     *
     * @see https://doc.rust-lang.org/std/fs/struct.File.html
     */
    class File : public NonConstructible, public io::Read, public io::Write
    {
    private:
        _fs_impl::NativeFile _inner;

    public:
        explicit File(_fs_impl::NativeFile &&inner);

        /** @brief Read-only. */
        static io::Result<File> open(const path::PathBuf &path);

        /** @brief Write-only, created if missing and truncated otherwise. */
        static io::Result<File> create(const path::PathBuf &path);

        /** @brief Read-write, failing with @ref io::ErrorKind::AlreadyExists if the path is taken. */
        static io::Result<File> create_new(const path::PathBuf &path);

        /** @brief `fstat` of the open descriptor. */
        io::Result<Metadata> metadata() const;

        io::Result<size_t> read(std::span<char> buffer) override;
        io::Result<size_t> write(std::span<const char> buffer) override;
        io::Result<std::monostate> flush() override;
    };

    /**
     * @brief An open directory.
     *
     * Opening anything that is not a directory fails with @ref io::ErrorKind::NotADirectory.
     */
    class Directory : public NonConstructible
    {
    private:
        _fs_impl::NativeFile _inner;

    public:
        explicit Directory(_fs_impl::NativeFile &&inner);

        static io::Result<Directory> open(const path::PathBuf &path);

        io::Result<Metadata> metadata() const;
    };

    /**
     * @brief Builder for the access and creation mode of an open call.
     *
     * @see https://doc.rust-lang.org/std/fs/struct.OpenOptions.html
     */
    class OpenOptions
    {
    private:
        _fs_impl::NativeOpenOptions _inner;

    public:
        explicit OpenOptions() noexcept;

        OpenOptions &read(bool read) noexcept;
        OpenOptions &write(bool write) noexcept;
        OpenOptions &append(bool append) noexcept;
        OpenOptions &truncate(bool truncate) noexcept;
        OpenOptions &create(bool create) noexcept;
        OpenOptions &create_new(bool create_new) noexcept;

        /**
         * @brief Extra bits or-ed into the flags of `open(2)`.
         *
         * @see https://doc.rust-lang.org/std/os/unix/fs/trait.OpenOptionsExt.html#tymethod.custom_flags
         */
        OpenOptions &custom_flags(int flags) noexcept;

        /** @brief Permission bits of a newly created file, before the umask. */
        OpenOptions &mode(mode_t mode) noexcept;

        io::Result<File> open(const path::PathBuf &path) const;

        /** @brief Opens with `O_DIRECTORY`, so only directories are accepted. */
        io::Result<Directory> open_dir(const path::PathBuf &path) const;
    };

    /**
     * @brief Builder for directory creation.
     *
     * @see https://doc.rust-lang.org/std/fs/struct.DirBuilder.html
     */
    class DirBuilder : public NonConstructible
    {
    private:
        bool _recursive;
        mode_t _mode;

    public:
        explicit DirBuilder();

        /** @brief Create missing ancestors too, and accept a directory that already exists. */
        DirBuilder &recursive(bool recursive) noexcept;
        DirBuilder &mode(mode_t mode) noexcept;

        io::Result<std::monostate> create(const path::PathBuf &path) const;
    };

    /** @see https://doc.rust-lang.org/std/fs/fn.create_dir.html */
    io::Result<std::monostate> create_dir(const path::PathBuf &path);

    /** @see https://doc.rust-lang.org/std/fs/fn.create_dir_all.html */
    io::Result<std::monostate> create_dir_all(const path::PathBuf &path);

    /**
     * @brief Metadata of the object at `path`, following symbolic links.
     *
     * @see https://doc.rust-lang.org/std/fs/fn.metadata.html
     */
    io::Result<Metadata> metadata(const path::PathBuf &path);
}
