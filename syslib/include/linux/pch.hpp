#pragma once

#include "pch.hpp"

/**
 * @brief Evaluate a libc call that signals failure with `-1` and `errno`.
 *
 * On failure the enclosing function returns `io::Result<value_type>` holding the captured OS error.
 * Otherwise the macro evaluates to the call's return value.
 */
#define OS_CVT(value_type, expr) ({                                        \
    auto _ret = (expr);                                                    \
    if (_ret == -1)                                                        \
    {                                                                      \
        return io::Result<value_type>::err(io::Error::last_os_error());    \
    }                                                                      \
    _ret;                                                                  \
})
