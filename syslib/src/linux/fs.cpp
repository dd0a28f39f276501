#include "fs.hpp"
#include "linux/pch.hpp"

namespace _fs_impl
{
    NativeMetadata::NativeMetadata(const struct stat &st) : NonConstructible(NonConstructibleTag::TAG), _stat(st) {}

    mode_t NativeMetadata::file_type() const noexcept
    {
        return _stat.st_mode & S_IFMT;
    }

    const struct stat &NativeMetadata::as_inner() const noexcept
    {
        return _stat;
    }

    io::Result<std::monostate> mkdir(const path::PathBuf &path, mode_t mode)
    {
        OS_CVT(std::monostate, ::mkdir(path.c_str(), mode));
        return io::Result<std::monostate>::ok(std::monostate{});
    }

    io::Result<NativeMetadata> metadata(const path::PathBuf &path)
    {
        struct stat st = {};
        OS_CVT(NativeMetadata, ::stat(path.c_str(), &st));
        return io::Result<NativeMetadata>::ok(NativeMetadata(st));
    }
}
