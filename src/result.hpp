#pragma once

#include <cerrno>
#include <system_error>
#include <utility>
#include <variant>

template <typename E>
struct ErrorWrapper {
    E value;
};

template <typename E>
ErrorWrapper<std::decay_t<E>> error(E&& e)
{
    return ErrorWrapper<std::decay_t<E>> { std::forward<E>(e) };
}

inline ErrorWrapper<std::error_code> errnoError(int err = errno)
{
    return error(std::make_error_code(static_cast<std::errc>(err)));
}

template <typename T, typename E = std::error_code>
class Result {
public:
    Result(const T& t)
        : value_(t)
    {
    }

    // Needed for move-only values like open file handles
    Result(T&& t)
        : value_(std::move(t))
    {
    }

    template <typename U>
    Result(ErrorWrapper<U>&& e)
        : value_(E { std::move(e.value) })
    {
    }

    bool hasValue() const { return value_.index() == 0; }
    explicit operator bool() const { return hasValue(); }

    const T& value() const { return std::get<0>(value_); }
    T& value() { return std::get<0>(value_); }

    const T& operator*() const { return value(); }
    T& operator*() { return value(); }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

    const E& error() const { return std::get<1>(value_); }

private:
    std::variant<T, E> value_;
};
