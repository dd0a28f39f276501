#include "fd_table.hpp"

namespace syscompat
{
    FdTable::FdTable() : NonConstructible(NonConstructibleTag::TAG) {}

    io::Result<int> FdTable::add(std::shared_ptr<vfs::FileLike> &&file)
    {
        std::lock_guard<std::mutex> lock(_mutex);

        // Entries are ordered, so the first gap is the lowest free descriptor.
        int fd = 0;
        for (const auto &[used, _] : _entries)
        {
            if (used != fd)
            {
                break;
            }
            fd++;
        }

        if (fd >= FILE_LIMIT)
        {
            return io::Result<int>::err(io::Error::from_raw_os_error(EMFILE));
        }

        _entries.emplace(fd, std::move(file));
        return io::Result<int>::ok(std::move(fd));
    }

    io::Result<std::monostate> FdTable::add_at(int fd, std::shared_ptr<vfs::FileLike> &&file)
    {
        if (fd < 0 || fd >= FILE_LIMIT)
        {
            return io::Result<std::monostate>::err(io::Error::from_raw_os_error(EBADF));
        }

        std::lock_guard<std::mutex> lock(_mutex);
        if (!_entries.emplace(fd, std::move(file)).second)
        {
            return io::Result<std::monostate>::err(
                io::Error(io::ErrorKind::AlreadyExists, std::format("descriptor {} is already open", fd)));
        }

        return io::Result<std::monostate>::ok(std::monostate{});
    }

    io::Result<std::shared_ptr<vfs::FileLike>> FdTable::get(int fd) const
    {
        std::lock_guard<std::mutex> lock(_mutex);

        auto iter = _entries.find(fd);
        if (iter == _entries.end())
        {
            return io::Result<std::shared_ptr<vfs::FileLike>>::err(io::Error::from_raw_os_error(EBADF));
        }

        return io::Result<std::shared_ptr<vfs::FileLike>>::ok(std::shared_ptr<vfs::FileLike>(iter->second));
    }

    io::Result<std::monostate> FdTable::close(int fd)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_entries.erase(fd) == 0)
        {
            return io::Result<std::monostate>::err(io::Error::from_raw_os_error(EBADF));
        }

        return io::Result<std::monostate>::ok(std::monostate{});
    }

    size_t FdTable::size() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries.size();
    }
}
