#pragma once

#include "pch.hpp"
#include "result.hpp"

namespace io
{
    /**
     * @brief Categories of I/O failure that the filesystem and syscall layers tell apart.
     *
     * Every OS error code maps onto exactly one kind; codes nobody distinguishes fall into @ref Other.
     *
     * @see https://doc.rust-lang.org/std/io/enum.ErrorKind.html
     */
    enum ErrorKind
    {
        /** @brief A path component does not exist. */
        NotFound,
        /** @brief The caller lacks permission for the object. */
        PermissionDenied,
        /** @brief The object, or the descriptor slot, is already taken. */
        AlreadyExists,
        /** @brief A descriptor does not refer to an open object. */
        BadFileDescriptor,
        /** @brief A caller-supplied address is null or otherwise unusable. */
        BadAddress,
        /** @brief A non-final path component, or an object opened as a directory, is something else. */
        NotADirectory,
        /** @brief An object opened as a file is a directory. */
        IsADirectory,
        /** @brief A path or path component is too long. */
        InvalidFilename,
        /** @brief Too many symbolic links were followed. */
        FilesystemLoop,
        /** @brief The per-process descriptor limit is reached. */
        TooManyOpenFiles,
        /** @brief An argument was rejected. */
        InvalidInput,
        /** @brief Input was read successfully but is malformed. */
        InvalidData,
        /** @brief The filesystem refuses to be written to. */
        ReadOnlyFilesystem,
        /** @brief No space left on the device. */
        StorageFull,
        /** @brief A blocking call was interrupted by a signal. */
        Interrupted,
        /** @brief An allocation failed. */
        OutOfMemory,
        /** @brief The operation is not implemented. */
        Unsupported,
        /** @brief Anything else. */
        Other,
    };

    /** @brief A short lowercase description such as `"entity not found"`. */
    const char *format_error_kind(ErrorKind kind);

    /**
     * @brief The error type of every fallible filesystem operation.
     *
     * Errors created from an OS error code remember that code, so a syscall can report the
     * exact errno it received through @ref raw_os_error.
     *
     * @see https://doc.rust-lang.org/std/io/struct.Error.html
     */
    class Error : public NonConstructible
    {
    private:
        ErrorKind _kind;
        std::optional<int> _code;
        std::string _message;

        explicit Error(ErrorKind kind, std::optional<int> code, std::string &&message);

    public:
        explicit Error(ErrorKind kind, const std::string &detail);

        static Error from_raw_os_error(int code);

        /** @brief Captures `errno`, which must be read before anything else can overwrite it. */
        static Error last_os_error();

        ErrorKind kind() const noexcept;
        std::optional<int> raw_os_error() const noexcept;
        const char *message() const noexcept;

        friend std::ostream &operator<<(std::ostream &os, const Error &err);
    };

    template <typename T>
    using Result = result::Result<T, Error>;

    class Read
    {
    public:
        virtual Result<size_t> read(std::span<char> buffer) = 0;
    };

    class Write
    {
    public:
        virtual Result<size_t> write(std::span<const char> buffer) = 0;
        virtual Result<std::monostate> flush() = 0;
    };
}
