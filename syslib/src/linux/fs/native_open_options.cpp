#include "fs.hpp"

namespace _fs_impl
{
    NativeOpenOptions::NativeOpenOptions()
        : NonConstructible(NonConstructibleTag::TAG),
          read(false),
          write(false),
          append(false),
          truncate(false),
          create(false),
          create_new(false),
          custom_flags(0),
          mode(0666) {}

    io::Result<int> NativeOpenOptions::open_flags() const
    {
        bool writable = write || append;
        if (!read && !writable)
        {
            return io::Result<int>::err(
                io::Error(io::ErrorKind::InvalidInput, "at least one of read, write or append access is required"));
        }

        // Append mode cannot truncate, unless the file is new anyway.
        if ((!writable && (create || create_new || truncate)) || (append && truncate && !create_new))
        {
            return io::Result<int>::err(
                io::Error(io::ErrorKind::InvalidInput, "creating or truncating a file requires write access"));
        }

        int flags = read && writable ? O_RDWR : (read ? O_RDONLY : O_WRONLY);
        if (append)
        {
            flags |= O_APPEND;
        }

        if (create_new)
        {
            flags |= O_CREAT | O_EXCL;
        }
        else
        {
            flags |= (create ? O_CREAT : 0) | (truncate ? O_TRUNC : 0);
        }

        return io::Result<int>::ok(flags | custom_flags);
    }
}
