#pragma once

#include <strata/error.hpp>
#include <cstddef>
#include <utility>
#include <variant>

namespace strata {

// Either a value or a StrataError. Accessing the wrong side throws
// std::bad_variant_access.
template<typename T>
class Result {
    static constexpr std::size_t kError = 0;
    static constexpr std::size_t kValue = 1;

public:
    // Implicit so a StrataError can be returned from any Result<T> function.
    Result(StrataError err) : state_(std::in_place_index<kError>, std::move(err)) {}

    static Result ok(T val) { return Result(std::in_place_index<kValue>, std::move(val)); }
    static Result err(StrataError e) { return Result(std::move(e)); }

    bool is_ok() const { return state_.index() == kValue; }
    bool is_err() const { return state_.index() == kError; }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<kValue>(state_); }
    const T& value() const& { return std::get<kValue>(state_); }
    T&& value() && { return std::get<kValue>(std::move(state_)); }

    StrataError& error() & { return std::get<kError>(state_); }
    const StrataError& error() const& { return std::get<kError>(state_); }
    StrataError&& error() && { return std::get<kError>(std::move(state_)); }

    T value_or(T fallback) const& {
        if (const T* v = std::get_if<kValue>(&state_)) return *v;
        return fallback;
    }

private:
    template<typename... Args>
    explicit Result(std::in_place_index_t<kValue> tag, Args&&... args)
        : state_(tag, std::forward<Args>(args)...) {}

    std::variant<StrataError, T> state_;
};

using Status = Result<std::monostate>;

inline Status ok_status() { return Status::ok({}); }

// Return the error of `expr` from the enclosing function.
#define STRATA_TRY(expr) \
    do { \
        auto&& strata_try_result_ = (expr); \
        if (strata_try_result_.is_err()) \
            return std::move(strata_try_result_).error(); \
    } while (0)

} // namespace strata
