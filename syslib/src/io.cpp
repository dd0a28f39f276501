#include "sys.hpp"

namespace io
{
    const char *format_error_kind(ErrorKind kind)
    {
        return sys::error_entry(kind).description;
    }

    Error::Error(ErrorKind kind, std::optional<int> code, std::string &&message)
        : NonConstructible(NonConstructibleTag::TAG), _kind(kind), _code(code), _message(std::move(message)) {}

    Error::Error(ErrorKind kind, const std::string &detail)
        : Error(kind, std::nullopt, std::format("{}: {}", format_error_kind(kind), detail)) {}

    Error Error::from_raw_os_error(int code)
    {
        auto kind = sys::decode_error_kind(code);
        return Error(kind, code, std::format("{} (os error {})", strerror(code), code));
    }

    Error Error::last_os_error()
    {
        return from_raw_os_error(errno);
    }

    ErrorKind Error::kind() const noexcept
    {
        return _kind;
    }

    std::optional<int> Error::raw_os_error() const noexcept
    {
        return _code;
    }

    const char *Error::message() const noexcept
    {
        return _message.c_str();
    }

    std::ostream &operator<<(std::ostream &os, const Error &err)
    {
        return os << err._message;
    }
}
