#pragma once

#include <map>
#include <mutex>

#include "vfs.hpp"

namespace syscompat
{
    /** @brief Maximum number of descriptors a process may hold open. */
    constexpr int FILE_LIMIT = 1024;

    /**
     * @brief Per-process table mapping descriptor numbers to open file-like objects.
     *
     * Entries are shared: a lookup hands out a reference that stays valid after the descriptor is closed.
     */
    class FdTable : public NonConstructible
    {
    private:
        mutable std::mutex _mutex;
        std::map<int, std::shared_ptr<vfs::FileLike>> _entries;

    public:
        explicit FdTable();

        /** @brief Installs `file` at the lowest free descriptor, failing with `EMFILE` when the table is full. */
        io::Result<int> add(std::shared_ptr<vfs::FileLike> &&file);

        /** @brief Installs `file` at exactly `fd`, failing if that descriptor is already in use. */
        io::Result<std::monostate> add_at(int fd, std::shared_ptr<vfs::FileLike> &&file);

        /** @brief Looks up `fd`, failing with `EBADF` if nothing is open there. */
        io::Result<std::shared_ptr<vfs::FileLike>> get(int fd) const;

        io::Result<std::monostate> close(int fd);

        size_t size() const;
    };
}
