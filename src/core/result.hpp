#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace uuidv47 {

/**
 * Failure categories. Callers branch on these, never on message text.
 */
enum class ErrorCode : int {
    Unknown = 0,
    InvalidFormat = 1,      // text is not a canonical identifier
    UnexpectedVersion = 2,  // encode/decode called on the wrong variant
    InvalidKey = 3,         // key text could not be parsed
    KeyNotConfigured = 4,   // no key available to the caller
    CryptoInit = 5,         // libsodium failed to initialise
    Storage = 6,            // persisted settings could not be written
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidFormat: return "invalid-format";
        case ErrorCode::UnexpectedVersion: return "unexpected-version";
        case ErrorCode::InvalidKey: return "invalid-key";
        case ErrorCode::KeyNotConfigured: return "key-not-configured";
        case ErrorCode::CryptoInit: return "crypto-init";
        case ErrorCode::Storage: return "storage";
    }
    return "unknown";
}

/**
 * Error type for Result - a human readable message plus a category.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::Unknown};

    Error() = default;
    explicit Error(std::string msg, ErrorCode c = ErrorCode::Unknown)
        : message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

namespace detail {

[[noreturn]] inline void throw_bad_unwrap(const Error& error) {
    throw std::runtime_error("Result::unwrap() called on error: " + error.message);
}

template<typename E>
[[noreturn]] void throw_bad_unwrap(const E&) {
    throw std::runtime_error("Result::unwrap() called on error");
}

[[noreturn]] inline void throw_bad_unwrap_err() {
    throw std::runtime_error("Result::unwrap_err() called on success");
}

} // namespace detail

/**
 * Result<T, E> - either a value (ok) or an error (err).
 *
 * Every fallible operation in the library returns one of these instead of
 * throwing. unwrap() is for call sites that have already checked is_ok().
 *
 *   auto id = Uuid::parse(text).and_then([&](const Uuid& v7) {
 *       return codec::encode(v7, key);
 *   });
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

    [[nodiscard]] const T& unwrap() const& {
        if (is_err()) detail::throw_bad_unwrap(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) detail::throw_bad_unwrap(std::get<1>(data_));
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) detail::throw_bad_unwrap_err();
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_err()) return Result<U, E>::err(std::get<1>(data_));
        return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
    }

    /**
     * map_err : Result<T, E> -> (E -> G) -> Result<T, G>
     */
    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using G = std::invoke_result_t<F, const E&>;
        if (is_ok()) return Result<T, G>::ok(std::get<0>(data_));
        return Result<T, G>::err(std::invoke(std::forward<F>(f), std::get<1>(data_)));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_err()) return ResultU::err(std::get<1>(data_));
        return std::invoke(std::forward<F>(f), std::get<0>(data_));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success without a value, or an error.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() { return Result(); }
    [[nodiscard]] static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool is_ok() const noexcept { return ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !ok_; }

    void unwrap() const {
        if (!ok_) detail::throw_bad_unwrap(error_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (ok_) detail::throw_bad_unwrap_err();
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (!ok_) return ResultU::err(error_);
        return std::invoke(std::forward<F>(f));
    }

private:
    Result() : ok_(true) {}
    explicit Result(E error) : ok_(false), error_(std::move(error)) {}

    bool ok_;
    E error_{};
};

} // namespace uuidv47
