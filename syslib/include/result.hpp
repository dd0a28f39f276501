#pragma once

#include "pch.hpp"

/**
 * @brief Evaluate a @ref result::Result expression and return its error early from the enclosing function.
 *
 * The enclosing function must return `result::Result<value_type, E>` where `E` is the error type of `expr`.
 * On success the macro evaluates to the moved-out value.
 */
#define SHORT_CIRCUIT(value_type, expr) ({                             \
    auto _result = (expr);                                             \
    if (_result.is_err())                                              \
    {                                                                  \
        return result::Result<                                         \
            value_type,                                                \
            std::remove_reference_t<decltype(_result.unwrap_err())>>:: \
            err(std::move(_result).into_err());                        \
    }                                                                  \
    std::move(_result).into_ok();                                      \
})

namespace result
{
    /**
     * @brief A type that represents either success or failure.
     *
     * @see https://doc.rust-lang.org/std/result/enum.Result.html
     */
    template <typename T, typename E>
    class Result : public NonConstructible
    {
    private:
        std::variant<T, E> _data;

        explicit Result(std::in_place_index_t<0>, T &&value)
            : NonConstructible(NonConstructibleTag::TAG), _data(std::in_place_index<0>, std::move(value)) {}
        explicit Result(std::in_place_index_t<1>, E &&error)
            : NonConstructible(NonConstructibleTag::TAG), _data(std::in_place_index<1>, std::move(error)) {}

    public:
        using Value = T;
        using Error = E;

        static Result ok(T &&value) { return Result(std::in_place_index<0>, std::move(value)); }
        static Result err(E &&error) { return Result(std::in_place_index<1>, std::move(error)); }

        bool is_ok() const noexcept { return _data.index() == 0; }
        bool is_err() const noexcept { return _data.index() == 1; }

        T into_ok() && { return std::get<0>(std::move(_data)); }
        E into_err() && { return std::get<1>(std::move(_data)); }

        T &unwrap()
        {
            if (!is_ok())
            {
                throw std::runtime_error("called unwrap() on Err");
            }
            return std::get<0>(_data);
        }

        const T &unwrap() const
        {
            if (!is_ok())
            {
                throw std::runtime_error("called unwrap() on Err");
            }
            return std::get<0>(_data);
        }

        E &unwrap_err()
        {
            if (!is_err())
            {
                throw std::runtime_error("called unwrap_err() on Ok");
            }
            return std::get<1>(_data);
        }

        const E &unwrap_err() const
        {
            if (!is_err())
            {
                throw std::runtime_error("called unwrap_err() on Ok");
            }
            return std::get<1>(_data);
        }

        /**
         * @brief Maps the contained value with `op`, leaving an error untouched.
         *
         * @see https://doc.rust-lang.org/std/result/enum.Result.html#method.map
         */
        template <typename F>
        Result<std::invoke_result_t<F, T &&>, E> map(F &&op) &&
        {
            using U = std::invoke_result_t<F, T &&>;
            if (is_ok())
            {
                return Result<U, E>::ok(std::invoke(std::forward<F>(op), std::get<0>(std::move(_data))));
            }

            return Result<U, E>::err(std::get<1>(std::move(_data)));
        }
    };
}
