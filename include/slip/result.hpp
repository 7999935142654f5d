#pragma once

#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace slip {

/**
 * Error carried by a failed Result.
 * An error may wrap the error of a lower layer; message() renders the chain
 * as "outer: inner".
 */
class Error {
public:
    explicit Error(std::string message) : _message(std::move(message)) {}

    Error(std::string message, const Error& cause)
        : _message(std::move(message)), _cause(std::make_shared<Error>(cause)) {}

    std::string message() const {
        if (!_cause) return _message;
        return _message + ": " + _cause->message();
    }

    const std::string& what() const noexcept { return _message; }
    const Error* cause() const noexcept { return _cause.get(); }

private:
    std::string _message;
    std::shared_ptr<const Error> _cause;
};

template<typename T = void>
class [[nodiscard]] Result {
public:
    Result(T value) : _state(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : _state(std::in_place_index<1>, std::move(error)) {}

    bool has_value() const noexcept { return _state.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    T& value() & { return std::get<0>(_state); }
    const T& value() const& { return std::get<0>(_state); }
    T&& value() && { return std::get<0>(std::move(_state)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<1>(_state); }

private:
    std::variant<T, Error> _state;
};

template<>
class [[nodiscard]] Result<void> {
public:
    Result() = default;
    Result(Error error) : _error(std::make_shared<Error>(std::move(error))) {}

    bool has_value() const noexcept { return !_error; }
    explicit operator bool() const noexcept { return has_value(); }

    const Error& error() const { return *_error; }

private:
    std::shared_ptr<const Error> _error;
};

inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message) {
    return Result<T>(Error(std::move(message)));
}

template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return Result<T>(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& res) {
    return res ? std::string() : res.error().message();
}

} // namespace slip
