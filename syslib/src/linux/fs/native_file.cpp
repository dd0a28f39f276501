#include "fs.hpp"
#include "linux/pch.hpp"

namespace _fs_impl
{
    OwnedFd::OwnedFd(int fd) noexcept : NonConstructible(NonConstructibleTag::TAG), _fd(fd) {}

    OwnedFd::OwnedFd(OwnedFd &&other) noexcept
        : NonConstructible(NonConstructibleTag::TAG), _fd(std::exchange(other._fd, -1)) {}

    OwnedFd::~OwnedFd()
    {
        if (_fd >= 0)
        {
            ::close(_fd);
        }
    }

    int OwnedFd::as_raw_fd() const noexcept
    {
        return _fd;
    }

    NativeFile::NativeFile(OwnedFd &&fd) : NonConstructible(NonConstructibleTag::TAG), _fd(std::move(fd)) {}

    io::Result<NativeFile> NativeFile::open(const path::PathBuf &path, const NativeOpenOptions &options, int extra_flags)
    {
        auto flags = SHORT_CIRCUIT(NativeFile, options.open_flags()) | O_CLOEXEC | extra_flags;
        auto fd = OS_CVT(NativeFile, ::open(path.c_str(), flags, options.mode));
        return io::Result<NativeFile>::ok(NativeFile(OwnedFd(fd)));
    }

    io::Result<size_t> NativeFile::read(std::span<char> buffer)
    {
        auto count = OS_CVT(size_t, ::read(_fd.as_raw_fd(), buffer.data(), buffer.size()));
        return io::Result<size_t>::ok(static_cast<size_t>(count));
    }

    io::Result<size_t> NativeFile::write(std::span<const char> buffer)
    {
        auto count = OS_CVT(size_t, ::write(_fd.as_raw_fd(), buffer.data(), buffer.size()));
        return io::Result<size_t>::ok(static_cast<size_t>(count));
    }

    io::Result<std::monostate> NativeFile::flush()
    {
        OS_CVT(std::monostate, ::fsync(_fd.as_raw_fd()));
        return io::Result<std::monostate>::ok(std::monostate{});
    }

    io::Result<NativeMetadata> NativeFile::metadata() const
    {
        struct stat st = {};
        OS_CVT(NativeMetadata, ::fstat(_fd.as_raw_fd(), &st));
        return io::Result<NativeMetadata>::ok(NativeMetadata(st));
    }
}
