#pragma once

#include "io.hpp"
#include "path.hpp"

namespace _fs_impl
{
    /** @brief Exclusive owner of a raw descriptor, closed on destruction. */
    class OwnedFd : public NonConstructible
    {
    private:
        int _fd;

    public:
        explicit OwnedFd(int fd) noexcept;
        OwnedFd(OwnedFd &&other) noexcept;
        OwnedFd &operator=(OwnedFd &&other) = delete;
        ~OwnedFd();

        int as_raw_fd() const noexcept;
    };

    class NativeOpenOptions : public NonConstructible
    {
    public:
        bool read;
        bool write;
        bool append;
        bool truncate;
        bool create;
        bool create_new;

        int custom_flags;
        mode_t mode;

        explicit NativeOpenOptions();

        /**
         * @brief The `flags` argument of `open(2)` for this combination of options.
         *
         * Creating or truncating without write access, and asking for no access at all, are rejected
         * with @ref io::ErrorKind::InvalidInput before any syscall is made.
         */
        io::Result<int> open_flags() const;
    };

    class NativeMetadata : public NonConstructible
    {
    private:
        struct stat _stat;

    public:
        explicit NativeMetadata(const struct stat &st);

        mode_t file_type() const noexcept;
        const struct stat &as_inner() const noexcept;
    };

    class NativeFile : public NonConstructible
    {
    private:
        OwnedFd _fd;

    public:
        explicit NativeFile(OwnedFd &&fd);

        /** @brief `open(2)` with `O_CLOEXEC` plus `extra_flags` added to the flags @ref NativeOpenOptions computes. */
        static io::Result<NativeFile> open(const path::PathBuf &path, const NativeOpenOptions &options, int extra_flags = 0);

        io::Result<size_t> read(std::span<char> buffer);
        io::Result<size_t> write(std::span<const char> buffer);
        io::Result<std::monostate> flush();
        io::Result<NativeMetadata> metadata() const;
    };

    io::Result<std::monostate> mkdir(const path::PathBuf &path, mode_t mode);

    /** @brief `stat(2)`: symbolic links are followed. */
    io::Result<NativeMetadata> metadata(const path::PathBuf &path);
}
