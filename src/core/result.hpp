#pragma once

#include <variant>
#include <string>
#include <optional>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace strata {

/**
 * ErrorKind - Where in the migration lifecycle a failure was detected.
 */
enum class ErrorKind {
    Declaration,   // raised while building a Schema/Version
    Precondition,  // raised by migrate() before touching the database
    Execution,     // raised by the engine while applying a migration
    Engine         // raw engine failure outside of a migration run
};

[[nodiscard]] constexpr const char* kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Declaration: return "declaration";
        case ErrorKind::Precondition: return "precondition";
        case ErrorKind::Execution: return "execution";
        case ErrorKind::Engine: return "engine";
    }
    return "unknown";
}

/**
 * Error type for Result - a failure with a message, an optional engine code,
 * and the migration context it happened in.
 */
struct Error {
    std::string message;
    int code{0};
    ErrorKind kind{ErrorKind::Engine};
    std::optional<int> version;      // version being applied, if any
    std::string operation;           // describe() of the failing operation

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    Error(ErrorKind k, std::string msg, int c = 0)
        : message(std::move(msg)), code(c), kind(k) {}

    [[nodiscard]] static Error declaration(std::string msg) {
        return Error{ErrorKind::Declaration, std::move(msg)};
    }

    [[nodiscard]] static Error precondition(std::string msg) {
        return Error{ErrorKind::Precondition, std::move(msg)};
    }

    /**
     * Re-tag an engine error as an execution failure of `op` in `version`.
     */
    [[nodiscard]] Error during(int version_number, std::string op) const {
        Error e = *this;
        e.kind = ErrorKind::Execution;
        e.version = version_number;
        e.operation = std::move(op);
        return e;
    }

    /**
     * Full diagnostic line, e.g.
     * "execution error in version 2 (rebuild table 'people'): no such column: nme"
     */
    [[nodiscard]] std::string describe() const {
        std::string out = kind_name(kind);
        out += " error";
        if (version) {
            out += " in version " + std::to_string(*version);
        }
        if (!operation.empty()) {
            out += " (" + operation + ")";
        }
        out += ": " + message;
        if (code != 0) {
            out += " [code " + std::to_string(code) + "]";
        }
        return out;
    }

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code && kind == other.kind;
    }
};

/**
 * Result<T, E> - Either a successful value (Ok) or an error (Err).
 *
 * Every fallible call in strata returns one of these; nothing throws except
 * unwrap() on the wrong alternative.
 *
 * Usage:
 *   auto schema = Schema::create("app", declare);
 *   if (schema.is_err()) return Result<void>::err(schema.unwrap_err());
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

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the success value, throwing if this is an error.
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(data_))));
        }
        return Result<U, E>::err(std::get<1>(std::move(data_)));
    }

    /**
     * map_err : Result<T, E> -> (E -> E) -> Result<T, E>
     */
    template<typename F>
    [[nodiscard]] Result map_err(F&& f) && {
        if (is_err()) {
            return Result::err(std::invoke(std::forward<F>(f), std::get<1>(std::move(data_))));
        }
        return Result::ok(std::get<0>(std::move(data_)));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " +
                                         std::get<1>(data_).describe());
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success carries no value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return is_ok_;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return !is_ok_;
    }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.describe());
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

    template<typename F>
    [[nodiscard]] Result map_err(F&& f) const {
        if (is_err()) {
            return Result::err(std::invoke(std::forward<F>(f), error_));
        }
        return Result::ok();
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

} // namespace strata
