#include "sys.hpp"

namespace
{
    using io::ErrorKind;

    // Indexed by ErrorKind, so the order must follow the enumeration.
    constexpr sys::ErrorEntry ENTRIES[] = {
        {ErrorKind::NotFound, ENOENT, "entity not found"},
        {ErrorKind::PermissionDenied, EACCES, "permission denied"},
        {ErrorKind::AlreadyExists, EEXIST, "entity already exists"},
        {ErrorKind::BadFileDescriptor, EBADF, "bad file descriptor"},
        {ErrorKind::BadAddress, EFAULT, "bad address"},
        {ErrorKind::NotADirectory, ENOTDIR, "not a directory"},
        {ErrorKind::IsADirectory, EISDIR, "is a directory"},
        {ErrorKind::InvalidFilename, ENAMETOOLONG, "invalid filename"},
        {ErrorKind::FilesystemLoop, ELOOP, "filesystem loop or indirection limit"},
        {ErrorKind::TooManyOpenFiles, EMFILE, "too many open files"},
        {ErrorKind::InvalidInput, EINVAL, "invalid input parameter"},
        {ErrorKind::InvalidData, EINVAL, "invalid data"},
        {ErrorKind::ReadOnlyFilesystem, EROFS, "read-only filesystem"},
        {ErrorKind::StorageFull, ENOSPC, "no storage space"},
        {ErrorKind::Interrupted, EINTR, "operation interrupted"},
        {ErrorKind::OutOfMemory, ENOMEM, "out of memory"},
        {ErrorKind::Unsupported, ENOSYS, "unsupported"},
        {ErrorKind::Other, EIO, "other error"},
    };

    static_assert(std::size(ENTRIES) == ErrorKind::Other + 1);
}

namespace sys
{
    const ErrorEntry &error_entry(io::ErrorKind kind)
    {
        return ENTRIES[kind];
    }

    io::ErrorKind decode_error_kind(int code)
    {
        switch (code)
        {
        case EPERM:
            return ErrorKind::PermissionDenied;
        case ENFILE:
            return ErrorKind::TooManyOpenFiles;
        case EIO:
            return ErrorKind::Other;
        default:
            break;
        }

        // The first row wins, so EINVAL decodes to InvalidInput.
        for (const auto &entry : ENTRIES)
        {
            if (entry.code == code)
            {
                return entry.kind;
            }
        }

        return ErrorKind::Other;
    }

    int encode_error_kind(io::ErrorKind kind)
    {
        return error_entry(kind).code;
    }
}
