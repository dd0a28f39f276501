#include "fs.hpp"

namespace fs
{
    Metadata::Metadata(_fs_impl::NativeMetadata &&inner)
        : NonConstructible(NonConstructibleTag::TAG), _inner(std::move(inner)) {}

    bool Metadata::is_dir() const
    {
        return _inner.file_type() == S_IFDIR;
    }

    bool Metadata::is_file() const
    {
        return _inner.file_type() == S_IFREG;
    }

    bool Metadata::is_symlink() const
    {
        return _inner.file_type() == S_IFLNK;
    }

    uint64_t Metadata::len() const
    {
        return static_cast<uint64_t>(_inner.as_inner().st_size);
    }

    uint64_t Metadata::dev() const
    {
        return _inner.as_inner().st_dev;
    }

    uint64_t Metadata::ino() const
    {
        return _inner.as_inner().st_ino;
    }

    uint32_t Metadata::mode() const
    {
        return _inner.as_inner().st_mode;
    }

    uint64_t Metadata::nlink() const
    {
        return _inner.as_inner().st_nlink;
    }

    uint32_t Metadata::uid() const
    {
        return _inner.as_inner().st_uid;
    }

    uint32_t Metadata::gid() const
    {
        return _inner.as_inner().st_gid;
    }

    uint64_t Metadata::rdev() const
    {
        return _inner.as_inner().st_rdev;
    }

    uint64_t Metadata::blksize() const
    {
        return static_cast<uint64_t>(_inner.as_inner().st_blksize);
    }

    uint64_t Metadata::blocks() const
    {
        return static_cast<uint64_t>(_inner.as_inner().st_blocks);
    }

    int64_t Metadata::atime() const
    {
        return _inner.as_inner().st_atim.tv_sec;
    }

    int64_t Metadata::atime_nsec() const
    {
        return _inner.as_inner().st_atim.tv_nsec;
    }

    int64_t Metadata::mtime() const
    {
        return _inner.as_inner().st_mtim.tv_sec;
    }

    int64_t Metadata::mtime_nsec() const
    {
        return _inner.as_inner().st_mtim.tv_nsec;
    }

    int64_t Metadata::ctime() const
    {
        return _inner.as_inner().st_ctim.tv_sec;
    }

    int64_t Metadata::ctime_nsec() const
    {
        return _inner.as_inner().st_ctim.tv_nsec;
    }

    File::File(_fs_impl::NativeFile &&inner) : NonConstructible(NonConstructibleTag::TAG), _inner(std::move(inner)) {}

    io::Result<File> File::open(const path::PathBuf &path)
    {
        return OpenOptions().read(true).open(path);
    }

    io::Result<File> File::create(const path::PathBuf &path)
    {
        return OpenOptions().write(true).create(true).truncate(true).open(path);
    }

    io::Result<File> File::create_new(const path::PathBuf &path)
    {
        return OpenOptions().read(true).write(true).create_new(true).open(path);
    }

    io::Result<Metadata> File::metadata() const
    {
        return _inner.metadata().map([](_fs_impl::NativeMetadata &&inner)
                                     { return Metadata(std::move(inner)); });
    }

    io::Result<size_t> File::read(std::span<char> buffer)
    {
        return _inner.read(buffer);
    }

    io::Result<size_t> File::write(std::span<const char> buffer)
    {
        return _inner.write(buffer);
    }

    io::Result<std::monostate> File::flush()
    {
        return _inner.flush();
    }

    Directory::Directory(_fs_impl::NativeFile &&inner) : NonConstructible(NonConstructibleTag::TAG), _inner(std::move(inner)) {}

    io::Result<Directory> Directory::open(const path::PathBuf &path)
    {
        return OpenOptions().read(true).open_dir(path);
    }

    io::Result<Metadata> Directory::metadata() const
    {
        return _inner.metadata().map([](_fs_impl::NativeMetadata &&inner)
                                     { return Metadata(std::move(inner)); });
    }

    OpenOptions::OpenOptions() noexcept : _inner() {}

    OpenOptions &OpenOptions::read(bool read) noexcept
    {
        _inner.read = read;
        return *this;
    }

    OpenOptions &OpenOptions::write(bool write) noexcept
    {
        _inner.write = write;
        return *this;
    }

    OpenOptions &OpenOptions::append(bool append) noexcept
    {
        _inner.append = append;
        return *this;
    }

    OpenOptions &OpenOptions::truncate(bool truncate) noexcept
    {
        _inner.truncate = truncate;
        return *this;
    }

    OpenOptions &OpenOptions::create(bool create) noexcept
    {
        _inner.create = create;
        return *this;
    }

    OpenOptions &OpenOptions::create_new(bool create_new) noexcept
    {
        _inner.create_new = create_new;
        return *this;
    }

    OpenOptions &OpenOptions::custom_flags(int flags) noexcept
    {
        _inner.custom_flags = flags;
        return *this;
    }

    OpenOptions &OpenOptions::mode(mode_t mode) noexcept
    {
        _inner.mode = mode;
        return *this;
    }

    io::Result<File> OpenOptions::open(const path::PathBuf &path) const
    {
        return _fs_impl::NativeFile::open(path, _inner).map([](_fs_impl::NativeFile &&inner)
                                                             { return File(std::move(inner)); });
    }

    io::Result<Directory> OpenOptions::open_dir(const path::PathBuf &path) const
    {
        return _fs_impl::NativeFile::open(path, _inner, O_DIRECTORY).map([](_fs_impl::NativeFile &&inner)
                                                                          { return Directory(std::move(inner)); });
    }

    DirBuilder::DirBuilder() : NonConstructible(NonConstructibleTag::TAG), _recursive(false), _mode(0777) {}

    DirBuilder &DirBuilder::recursive(bool recursive) noexcept
    {
        _recursive = recursive;
        return *this;
    }

    DirBuilder &DirBuilder::mode(mode_t mode) noexcept
    {
        _mode = mode;
        return *this;
    }

    io::Result<std::monostate> DirBuilder::create(const path::PathBuf &path) const
    {
        if (!_recursive)
        {
            return _fs_impl::mkdir(path, _mode);
        }

        // Walk up until an existing ancestor is found, deepest missing directory first.
        std::vector<path::PathBuf> missing;
        for (auto current = path; !current.empty(); current = current.parent_path())
        {
            auto existing = _fs_impl::metadata(current);
            if (existing.is_ok())
            {
                if (existing.unwrap().file_type() != S_IFDIR)
                {
                    return io::Result<std::monostate>::err(io::Error::from_raw_os_error(current == path ? EEXIST : ENOTDIR));
                }
                break;
            }

            if (existing.unwrap_err().kind() != io::ErrorKind::NotFound)
            {
                return io::Result<std::monostate>::err(std::move(existing).into_err());
            }

            missing.push_back(current);
            if (current == current.parent_path())
            {
                break;
            }
        }

        for (auto iter = missing.rbegin(); iter != missing.rend(); iter++)
        {
            auto result = _fs_impl::mkdir(*iter, _mode);

            // Someone else may have created it in the meantime.
            if (result.is_err() && result.unwrap_err().kind() != io::ErrorKind::AlreadyExists)
            {
                return result;
            }
        }

        return io::Result<std::monostate>::ok(std::monostate{});
    }

    io::Result<std::monostate> create_dir(const path::PathBuf &path)
    {
        return DirBuilder().create(path);
    }

    io::Result<std::monostate> create_dir_all(const path::PathBuf &path)
    {
        return DirBuilder().recursive(true).create(path);
    }

    io::Result<Metadata> metadata(const path::PathBuf &path)
    {
        return _fs_impl::metadata(path).map([](_fs_impl::NativeMetadata &&inner)
                                            { return Metadata(std::move(inner)); });
    }
}
