#pragma once

#include "io.hpp"

namespace syscompat
{
    /**
     * @brief A pointer into caller memory that the kernel writes through.
     *
     * Nothing is dereferenced until @ref get_as_mut has validated the address.
     */
    template <typename T>
    class UserPtr
    {
    private:
        T *_ptr;

    public:
        explicit UserPtr(T *ptr) noexcept : _ptr(ptr) {}

        static UserPtr from_raw(uint64_t address) noexcept
        {
            return UserPtr(reinterpret_cast<T *>(static_cast<uintptr_t>(address)));
        }

        /** @brief Fails with `EFAULT` for null or misaligned addresses. */
        io::Result<T *> get_as_mut() const
        {
            if (_ptr == nullptr || reinterpret_cast<uintptr_t>(_ptr) % alignof(T) != 0)
            {
                return io::Result<T *>::err(io::Error::from_raw_os_error(EFAULT));
            }

            T *ptr = _ptr;
            return io::Result<T *>::ok(std::move(ptr));
        }
    };

    /** @brief A pointer into caller memory that the kernel only reads. */
    template <typename T>
    class UserConstPtr
    {
    private:
        const T *_ptr;

    public:
        explicit UserConstPtr(const T *ptr) noexcept : _ptr(ptr) {}

        static UserConstPtr from_raw(uint64_t address) noexcept
        {
            return UserConstPtr(reinterpret_cast<const T *>(static_cast<uintptr_t>(address)));
        }

        /**
         * @brief Reads a NUL-terminated string of at most `PATH_MAX` bytes.
         *
         * Fails with `EFAULT` for a null pointer and `ENAMETOOLONG` when no terminator is found in time.
         */
        io::Result<std::string_view> get_as_str() const
        {
            if (_ptr == nullptr)
            {
                return io::Result<std::string_view>::err(io::Error::from_raw_os_error(EFAULT));
            }

            auto length = strnlen(_ptr, PATH_MAX);
            if (length == PATH_MAX)
            {
                return io::Result<std::string_view>::err(io::Error::from_raw_os_error(ENAMETOOLONG));
            }

            return io::Result<std::string_view>::ok(std::string_view(_ptr, length));
        }

        /** @brief Same as @ref get_as_str, but a null pointer reads as absent instead of failing. */
        io::Result<std::optional<std::string_view>> get_as_str_nullable() const
        {
            if (_ptr == nullptr)
            {
                return io::Result<std::optional<std::string_view>>::ok(std::nullopt);
            }

            auto str = SHORT_CIRCUIT(std::optional<std::string_view>, get_as_str());
            return io::Result<std::optional<std::string_view>>::ok(std::optional<std::string_view>(str));
        }
    };
}
