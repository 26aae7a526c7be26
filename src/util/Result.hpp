#pragma once
// Result.hpp - Value-or-error return type used across the pipeline
// Errors carry a kind so callers can apply policy (retry, fallback, abort)

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include "util/Types.hpp"

namespace lf {

enum class ErrorKind {
    Generic,
    InvalidArgument,
    Io,
    Config,
    TimingGap,
    LayoutOverflow,
    EffectConfig,
    FrameRenderTimeout,
    Encoding,
    Cancelled
};

const char* errorKindName(ErrorKind kind);

struct Error {
    std::string message;
    ErrorKind kind{ErrorKind::Generic};
    std::optional<u64> frameIndex;
    bool recoverable{false};

    Error() = default;
    Error(std::string msg) : message(std::move(msg)) {
    }
    Error(const char* msg) : message(msg) {
    }
    Error(ErrorKind k, std::string msg) : message(std::move(msg)), kind(k) {
    }

    Error& atFrame(u64 index) {
        frameIndex = index;
        return *this;
    }
    Error& markRecoverable(bool v = true) {
        recoverable = v;
        return *this;
    }

    // "<Kind>: message (frame N)"
    std::string describe() const;
};

template <typename T>
class [[nodiscard]] Result {
public:
    static Result ok(T value) {
        return Result(std::move(value));
    }
    static Result err(Error error) {
        return Result(std::move(error));
    }
    static Result err(ErrorKind kind, std::string message) {
        return Result(Error(kind, std::move(message)));
    }

    bool isOk() const {
        return std::holds_alternative<T>(data_);
    }
    bool isErr() const {
        return !isOk();
    }
    explicit operator bool() const {
        return isOk();
    }

    T& value() & {
        return std::get<T>(data_);
    }
    const T& value() const& {
        return std::get<T>(data_);
    }
    T&& value() && {
        return std::get<T>(std::move(data_));
    }

    T& operator*() & {
        return value();
    }
    const T& operator*() const& {
        return value();
    }
    T&& operator*() && {
        return std::move(*this).value();
    }
    T* operator->() {
        return &value();
    }
    const T* operator->() const {
        return &value();
    }

    const Error& error() const {
        return std::get<Error>(data_);
    }
    Error& error() {
        return std::get<Error>(data_);
    }

    T valueOr(T fallback) const& {
        return isOk() ? value() : std::move(fallback);
    }

private:
    explicit Result(T value) : data_(std::move(value)) {
    }
    explicit Result(Error error) : data_(std::move(error)) {
    }

    std::variant<T, Error> data_;
};

template <>
class [[nodiscard]] Result<void> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(Error error) {
        return Result(std::move(error));
    }
    static Result err(ErrorKind kind, std::string message) {
        return Result(Error(kind, std::move(message)));
    }

    bool isOk() const {
        return !error_.has_value();
    }
    bool isErr() const {
        return error_.has_value();
    }
    explicit operator bool() const {
        return isOk();
    }

    const Error& error() const {
        return *error_;
    }
    Error& error() {
        return *error_;
    }

private:
    Result() = default;
    explicit Result(Error error) : error_(std::move(error)) {
    }

    std::optional<Error> error_;
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Generic:
        return "Error";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    case ErrorKind::Io:
        return "IoError";
    case ErrorKind::Config:
        return "ConfigError";
    case ErrorKind::TimingGap:
        return "TimingGapError";
    case ErrorKind::LayoutOverflow:
        return "LayoutOverflowError";
    case ErrorKind::EffectConfig:
        return "EffectConfigError";
    case ErrorKind::FrameRenderTimeout:
        return "FrameRenderTimeout";
    case ErrorKind::Encoding:
        return "EncodingError";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Error";
}

inline std::string Error::describe() const {
    std::string s = std::string(errorKindName(kind)) + ": " + message;
    if (frameIndex)
        s += " (frame " + std::to_string(*frameIndex) + ")";
    return s;
}

} // namespace lf
