#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace relay {

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

struct OkUnit {};

template<typename T, typename E = std::string>
class Result {
private:
    std::variant<T, E> data_;

public:
    template<typename U, typename = std::enable_if_t<std::is_constructible_v<T, U&&>>>
    Result(OkValue<U> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    template<typename U, typename = std::enable_if_t<std::is_constructible_v<E, U&&>>>
    Result(ErrValue<U> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(OkUnit) : error_(std::nullopt) {}

    template<typename U, typename = std::enable_if_t<std::is_constructible_v<E, U&&>>>
    Result(ErrValue<U> err) : error_(E(std::move(err.error))) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
OkValue<std::decay_t<T>> Ok(T&& value) { return OkValue<std::decay_t<T>>(std::forward<T>(value)); }

inline OkUnit Ok() { return OkUnit{}; }

template<typename E>
ErrValue<std::decay_t<E>> Err(E&& error) { return ErrValue<std::decay_t<E>>(std::forward<E>(error)); }

} // namespace relay
