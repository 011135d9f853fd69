#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace pmc {

//=============================================================================
// Error - message, optional category code and optional chained cause
//=============================================================================

class Error {
public:
    Error() = default;

    explicit Error(std::string message, int code = 0)
        : _message(std::move(message)), _code(code) {}

    Error(std::string message, const Error& cause)
        : _message(std::move(message)), _code(cause.code()),
          _cause(std::make_shared<const Error>(cause)) {}

    const std::string& message() const { return _message; }

    // Category code of this error, or of the first cause carrying one
    int code() const { return _code; }

    const Error* cause() const { return _cause.get(); }

    // "outer: inner: root"
    std::string to_string() const {
        std::string s = _message;
        for (const Error* c = _cause.get(); c; c = c->_cause.get()) {
            if (c->_message.empty()) continue;
            s += s.empty() ? "" : ": ";
            s += c->_message;
        }
        return s;
    }

private:
    std::string _message;
    int _code = 0;
    std::shared_ptr<const Error> _cause;
};

//=============================================================================
// Result<T> - value or Error
//=============================================================================

template<typename T>
class [[nodiscard]] Result {
public:
    using ValueType = T;

    Result(T value) : _data(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : _data(std::in_place_index<1>, std::move(error)) {}

    // Result<const char*> -> Result<std::string> and similar
    template<typename U,
             typename = std::enable_if_t<!std::is_same_v<U, T> && std::is_convertible_v<U, T>>>
    Result(Result<U> other)
        : _data(other ? Storage(std::in_place_index<0>, T(std::move(*other)))
                      : Storage(std::in_place_index<1>, other.error())) {}

    bool has_value() const { return _data.index() == 0; }
    explicit operator bool() const { return has_value(); }

    T& value() & { return std::get<0>(_data); }
    const T& value() const& { return std::get<0>(_data); }
    T&& value() && { return std::get<0>(std::move(_data)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<1>(_data); }

private:
    using Storage = std::variant<T, Error>;
    Storage _data;
};

template<>
class [[nodiscard]] Result<void> {
public:
    using ValueType = void;

    Result() = default;
    Result(Error error) : _error(std::move(error)) {}

    bool has_value() const { return !_error.has_value(); }
    explicit operator bool() const { return has_value(); }

    const Error& error() const { return *_error; }

private:
    std::optional<Error> _error;
};

//=============================================================================
// Constructors
//=============================================================================

inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message, int code = 0) {
    return Result<T>(Error(std::move(message), code));
}

template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    if (cause) return Result<T>(Error(std::move(message)));
    return Result<T>(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) return {};
    return result.error().to_string();
}

} // namespace pmc
