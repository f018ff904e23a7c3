#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace lanmail {

/**
 * ErrorCode - failure taxonomy shared by the discovery and messaging layers.
 */
enum class ErrorCode {
    Unknown = 0,
    MalformedDatagram,
    PeerNotFound,
    ConnectionError,
    MalformedMessage,
    BindFailed,
    InvalidConfig,
};

[[nodiscard]] constexpr const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::MalformedDatagram: return "malformed datagram";
        case ErrorCode::PeerNotFound: return "peer not found";
        case ErrorCode::ConnectionError: return "connection error";
        case ErrorCode::MalformedMessage: return "malformed message";
        case ErrorCode::BindFailed: return "bind failed";
        case ErrorCode::InvalidConfig: return "invalid config";
    }
    return "unknown";
}

struct Error {
    std::string message;
    ErrorCode code{ErrorCode::Unknown};

    Error() = default;
    explicit Error(std::string msg, ErrorCode c = ErrorCode::Unknown)
        : message(std::move(msg)), code(c) {}

    bool operator==(const Error&) const = default;
};

namespace detail {

[[noreturn]] inline void throw_bad_unwrap(const Error& error) {
    throw std::runtime_error(std::string("unwrap() on ") + to_string(error.code) + ": " + error.message);
}

[[noreturn]] inline void throw_bad_unwrap_err() {
    throw std::runtime_error("unwrap_err() on a successful result");
}

} // namespace detail

/**
 * Result<T> - either a value or an Error.
 *
 * Network and registry operations return Results instead of throwing; only
 * unwrap() on the wrong alternative throws.
 *
 *   auto sent = sender.send_mail(mail, host, port);
 *   if (sent.is_err()) {
 *       qWarning() << sent.unwrap_err().message.c_str();
 *   }
 */
template<typename T>
class Result {
public:
    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(Error error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return state_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return state_.index() == 1; }

    [[nodiscard]] const T& unwrap() const& {
        if (is_err()) detail::throw_bad_unwrap(std::get<1>(state_));
        return std::get<0>(state_);
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) detail::throw_bad_unwrap(std::get<1>(state_));
        return std::get<0>(std::move(state_));
    }

    [[nodiscard]] const Error& unwrap_err() const {
        if (is_ok()) detail::throw_bad_unwrap_err();
        return std::get<1>(state_);
    }

    // Runs f on the error, if any, and returns this Result unchanged.
    template<typename F>
    const Result& inspect_err(F&& f) const {
        if (is_err()) std::invoke(std::forward<F>(f), std::get<1>(state_));
        return *this;
    }

private:
    template<size_t I, typename Arg>
    Result(std::in_place_index_t<I> idx, Arg&& arg) : state_(idx, std::forward<Arg>(arg)) {}

    // Indexed access so Result<Error> stays unambiguous.
    std::variant<T, Error> state_;
};

template<>
class Result<void> {
public:
    [[nodiscard]] static Result ok() { return Result(); }
    [[nodiscard]] static Result err(Error error) { return Result(std::move(error)); }

    [[nodiscard]] bool is_ok() const noexcept { return !failed_; }
    [[nodiscard]] bool is_err() const noexcept { return failed_; }

    void unwrap() const {
        if (failed_) detail::throw_bad_unwrap(error_);
    }

    [[nodiscard]] const Error& unwrap_err() const {
        if (!failed_) detail::throw_bad_unwrap_err();
        return error_;
    }

    template<typename F>
    const Result& inspect_err(F&& f) const {
        if (failed_) std::invoke(std::forward<F>(f), error_);
        return *this;
    }

private:
    Result() = default;
    explicit Result(Error error) : failed_(true), error_(std::move(error)) {}

    bool failed_ = false;
    Error error_;
};

} // namespace lanmail
