#pragma once

#include "errors.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace toolgov::core {

// Value-or-error return type for fallible operations
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    static Result err(ErrorCode code, std::string message) {
        return err(E{code, std::move(message)});
    }

    static Result err(ErrorCode code, std::string message, std::string context) {
        return err(E{code, std::move(message), std::move(context)});
    }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    T& value() & {
        check_ok();
        return std::get<0>(data_);
    }

    const T& value() const& {
        check_ok();
        return std::get<0>(data_);
    }

    T&& value() && {
        check_ok();
        return std::get<0>(std::move(data_));
    }

    E& error() & {
        check_err();
        return std::get<1>(data_);
    }

    const E& error() const& {
        check_err();
        return std::get<1>(data_);
    }

    E&& error() && {
        check_err();
        return std::get<1>(std::move(data_));
    }

private:
    template<size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

    void check_ok() const {
        if (!is_ok()) {
            throw std::logic_error("Result holds an error, not a value");
        }
    }

    void check_err() const {
        if (!is_err()) {
            throw std::logic_error("Result holds a value, not an error");
        }
    }

    // Index 0 is the value, 1 the error, so T and E may be the same type
    std::variant<T, E> data_;
};

// Result of an operation with nothing to return
template<typename E>
class Result<void, E> {
public:
    static Result ok() {
        return Result();
    }

    static Result err(E error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    static Result err(ErrorCode code, std::string message) {
        return err(E{code, std::move(message)});
    }

    static Result err(ErrorCode code, std::string message, std::string context) {
        return err(E{code, std::move(message), std::move(context)});
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }

    const E& error() const& {
        if (!error_) {
            throw std::logic_error("Result holds no error");
        }
        return *error_;
    }

    E&& error() && {
        if (!error_) {
            throw std::logic_error("Result holds no error");
        }
        return std::move(*error_);
    }

private:
    Result() = default;

    std::optional<E> error_;
};

}  // namespace toolgov::core
