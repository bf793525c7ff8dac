#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace mcp_agent {

// ---------------------------------------------------------------------------
// Result<T, E>: a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    // fn: T -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

    // fn: T -> U
    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using U = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(std::move(storage_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(storage_)));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: classifies errors for exit codes, logging and whether a
// failure is fatal to the run.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Config,          // missing credential or invalid parameter
    Connection,      // tool provider unreachable / transport failure
    Provider,        // tool listing failed
    Tool,            // a dispatched tool call failed
    NotFound,        // no provider claimed a tool
    Completion,      // completion API failed or returned malformed content
    Authentication,  // completion API rejected the credentials
    RateLimited,     // completion API throttled or overloaded
    Timeout,
    Serialization,
    Cancelled,
    Internal,
};

// ---------------------------------------------------------------------------
// Error: structured error type shared by every component.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string endpoint;
    std::optional<int> http_status;
    std::string message;
    std::optional<std::string> detail;
    ErrorCategory category = ErrorCategory::Internal;

    /// Create an Error from a completion API HTTP status. Extracts the
    /// `error.message` field from an Anthropic-style JSON error body.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Connection:     return 1;
            case ErrorCategory::Provider:       return 1;
            case ErrorCategory::Config:         return 2;
            case ErrorCategory::Completion:     return 3;
            case ErrorCategory::Authentication: return 3;
            case ErrorCategory::RateLimited:    return 3;
            case ErrorCategory::Tool:           return 4;
            case ErrorCategory::NotFound:       return 4;
            case ErrorCategory::Timeout:        return 5;
            case ErrorCategory::Cancelled:      return 6;
            case ErrorCategory::Serialization:  return 99;
            case ErrorCategory::Internal:       return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::Config:         return "config";
            case ErrorCategory::Connection:     return "connection";
            case ErrorCategory::Provider:       return "provider";
            case ErrorCategory::Tool:           return "tool";
            case ErrorCategory::NotFound:       return "not_found";
            case ErrorCategory::Completion:     return "completion";
            case ErrorCategory::Authentication: return "authentication";
            case ErrorCategory::RateLimited:    return "rate_limited";
            case ErrorCategory::Timeout:        return "timeout";
            case ErrorCategory::Serialization:  return "serialization";
            case ErrorCategory::Cancelled:      return "cancelled";
            case ErrorCategory::Internal:       return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const;

    // Single-line JSON object: {"error":{"category":...,"exit_code":N}}.
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               endpoint == other.endpoint &&
               http_status == other.http_status &&
               message == other.message &&
               detail == other.detail &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace mcp_agent
