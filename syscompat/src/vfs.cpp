#include "vfs.hpp"

namespace syscompat::vfs
{
    File::File(fs::File &&inner, path::PathBuf &&path)
        : NonConstructible(NonConstructibleTag::TAG), _inner(std::move(inner)), _path(std::move(path)) {}

    const path::PathBuf &File::path() const noexcept
    {
        return _path;
    }

    io::Result<Kstat> File::stat() const
    {
        auto metadata = SHORT_CIRCUIT(Kstat, _inner.metadata());
        return io::Result<Kstat>::ok(Kstat::from_metadata(metadata));
    }

    Directory::Directory(fs::Directory &&inner, path::PathBuf &&path)
        : NonConstructible(NonConstructibleTag::TAG), _inner(std::move(inner)), _path(std::move(path)) {}

    const path::PathBuf &Directory::path() const noexcept
    {
        return _path;
    }

    io::Result<Kstat> Directory::stat() const
    {
        auto metadata = SHORT_CIRCUIT(Kstat, _inner.metadata());
        return io::Result<Kstat>::ok(Kstat::from_metadata(metadata));
    }

    HostFileSystem::HostFileSystem(path::PathBuf &&root)
        : NonConstructible(NonConstructibleTag::TAG), _root(std::move(root)) {}

    path::PathBuf HostFileSystem::_host_path(const path::PathBuf &path) const
    {
        // Normalizing an absolute path drops every leading "..". Symlinks are left to the host.
        auto normal = (path::PathBuf("/") / path).lexically_normal();
        return _root / normal.relative_path();
    }

    io::Result<std::unique_ptr<File>> HostFileSystem::open_file(const path::PathBuf &path, const fs::OpenOptions &options)
    {
        auto file = SHORT_CIRCUIT(std::unique_ptr<File>, options.open(_host_path(path)));

        // The host happily opens directories read-only, this filesystem does not.
        auto metadata = SHORT_CIRCUIT(std::unique_ptr<File>, file.metadata());
        if (metadata.is_dir())
        {
            return io::Result<std::unique_ptr<File>>::err(
                io::Error(io::ErrorKind::IsADirectory, std::format("cannot open {} as a file", path.string())));
        }

        return io::Result<std::unique_ptr<File>>::ok(std::make_unique<File>(std::move(file), path::PathBuf(path)));
    }

    io::Result<std::unique_ptr<Directory>> HostFileSystem::open_dir(const path::PathBuf &path, const fs::OpenOptions &options)
    {
        auto dir = SHORT_CIRCUIT(std::unique_ptr<Directory>, options.open_dir(_host_path(path)));
        return io::Result<std::unique_ptr<Directory>>::ok(std::make_unique<Directory>(std::move(dir), path::PathBuf(path)));
    }
}
