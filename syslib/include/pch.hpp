#pragma once

#if !defined(__linux__)
#error "syslib only supports Linux"
#endif

#define _FILE_OFFSET_BITS 64

#include <atomic>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <format>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <sys/types.h>

/** @brief Proof of intent passed to the @ref NonConstructible constructor. */
struct NonConstructibleTag final
{
private:
    explicit constexpr NonConstructibleTag() noexcept = default;

public:
    static const NonConstructibleTag TAG;
};

/**
 * @brief Base of move-only types that are never default-constructed or copied by accident.
 *
 * Derived types forward @ref NonConstructibleTag::TAG from each of their own constructors:
 *
 * @code
 * class Handle : public NonConstructible
 * {
 *     int _fd;
 *
 * public:
 *     explicit Handle(int fd) : NonConstructible(NonConstructibleTag::TAG), _fd(fd) {}
 * };
 * @endcode
 */
class NonConstructible
{
public:
    NonConstructible() = delete;
    NonConstructible(const NonConstructible &) = delete;
    NonConstructible &operator=(const NonConstructible &) = delete;
    NonConstructible(NonConstructible &&) noexcept = default;
    NonConstructible &operator=(NonConstructible &&) noexcept = default;

protected:
    explicit NonConstructible(NonConstructibleTag) noexcept {}
};
