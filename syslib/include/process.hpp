#pragma once

#include "pch.hpp"

namespace process
{
    /**
     * @brief Returns the OS-assigned process identifier associated with this process.
     *
     * @see https://doc.rust-lang.org/std/process/fn.id.html
     */
    uint32_t id();
}
