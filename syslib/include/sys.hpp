#pragma once

#include "io.hpp"

namespace sys
{
    /** @brief One row of the errno <-> @ref io::ErrorKind correspondence. */
    struct ErrorEntry
    {
        io::ErrorKind kind;
        int code;
        const char *description;
    };

    /** @brief The row of `kind`. Every kind has one; @ref io::ErrorKind::Other reports `EIO`. */
    const ErrorEntry &error_entry(io::ErrorKind kind);

    /**
     * @brief Classify an OS error code.
     *
     * @see https://github.com/rust-lang/rust/blob/8182085617878610473f0b88f07fc9803f4b4960/library/std/src/sys/pal/unix/mod.rs#L247-L293
     */
    io::ErrorKind decode_error_kind(int code);

    /** @brief The OS error code reported for an error that was not born from one. */
    int encode_error_kind(io::ErrorKind kind);
}
