#pragma once

#include "core/errors.h"

#include <optional>
#include <utility>

namespace augur::core {

enum class ErrorCode {
    Ok = 0,
    Parse,
    Io,
    Range,
    Timeout,
    Proto,
    NoMem,
    Invalid,
    WrongLength,
    DecisionOutOfRange,
    TooShort,
    NoValidTuple
};

inline ErrorCode to_error(AugurStatus status) {
    switch (status) {
        case AUGUR_OK: return ErrorCode::Ok;
        case AUGUR_ERR_PARSE: return ErrorCode::Parse;
        case AUGUR_ERR_IO: return ErrorCode::Io;
        case AUGUR_ERR_RANGE: return ErrorCode::Range;
        case AUGUR_ERR_TIMEOUT: return ErrorCode::Timeout;
        case AUGUR_ERR_PROTO: return ErrorCode::Proto;
        case AUGUR_ERR_NOMEM: return ErrorCode::NoMem;
        case AUGUR_ERR_INVALID: return ErrorCode::Invalid;
        case AUGUR_ERR_WRONG_LENGTH: return ErrorCode::WrongLength;
        case AUGUR_ERR_DECISION_RANGE: return ErrorCode::DecisionOutOfRange;
        case AUGUR_ERR_TOO_SHORT: return ErrorCode::TooShort;
        case AUGUR_ERR_NO_VALID_TUPLE: return ErrorCode::NoValidTuple;
        default: return ErrorCode::Invalid;
    }
}

inline AugurStatus to_status(ErrorCode error) {
    switch (error) {
        case ErrorCode::Ok: return AUGUR_OK;
        case ErrorCode::Parse: return AUGUR_ERR_PARSE;
        case ErrorCode::Io: return AUGUR_ERR_IO;
        case ErrorCode::Range: return AUGUR_ERR_RANGE;
        case ErrorCode::Timeout: return AUGUR_ERR_TIMEOUT;
        case ErrorCode::Proto: return AUGUR_ERR_PROTO;
        case ErrorCode::NoMem: return AUGUR_ERR_NOMEM;
        case ErrorCode::Invalid: return AUGUR_ERR_INVALID;
        case ErrorCode::WrongLength: return AUGUR_ERR_WRONG_LENGTH;
        case ErrorCode::DecisionOutOfRange: return AUGUR_ERR_DECISION_RANGE;
        case ErrorCode::TooShort: return AUGUR_ERR_TOO_SHORT;
        case ErrorCode::NoValidTuple: return AUGUR_ERR_NO_VALID_TUPLE;
        default: return AUGUR_ERR_INVALID;
    }
}

inline const char* error_to_string(ErrorCode error) {
    switch (error) {
        case ErrorCode::Ok: return "ok";
        case ErrorCode::Parse: return "parse";
        case ErrorCode::Io: return "io";
        case ErrorCode::Range: return "range";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::Proto: return "proto";
        case ErrorCode::NoMem: return "nomem";
        case ErrorCode::Invalid: return "invalid";
        case ErrorCode::WrongLength: return "wrong_length";
        case ErrorCode::DecisionOutOfRange: return "decision_out_of_range";
        case ErrorCode::TooShort: return "too_short";
        case ErrorCode::NoValidTuple: return "no_valid_tuple";
        default: return "unknown";
    }
}

template <typename T>
class Expected {
public:
    Expected(const T& value) : value_(value), error_(ErrorCode::Ok) {}
    Expected(T&& value) : value_(std::move(value)), error_(ErrorCode::Ok) {}
    Expected(ErrorCode error) : value_(std::nullopt), error_(error) {}

    [[nodiscard]] bool has_value() const { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const { return has_value(); }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    [[nodiscard]] ErrorCode error() const { return error_; }

private:
    std::optional<T> value_;
    ErrorCode error_;
};

} // namespace augur::core
