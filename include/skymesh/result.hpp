/**
 * skymesh - Result Type
 *
 * Result<T> holds either a decoded value or an Error describing why a
 * decode step failed. Every recoverable failure in the decoding engine
 * travels through this type instead of an exception.
 */

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>

namespace skymesh {

/**
 * Error information with code and message
 */
struct Error {
    enum class Code {
        None = 0,
        MalformedHeader,        // No layout candidate passed the structural gate
        DecompressionFailure,   // Codec failure or output size mismatch
        SizeMismatch,           // Payload shorter than the encoding requires
        IndexRegionNotFound,    // Locator exhausted its search budget
        ImplausibleResult,      // Validator rejected a complete decode
        AllStrategiesFailed,    // Orchestrator terminal state
        CodecUnavailable,       // Block codec missing or broken (fatal)
        FileNotFound,
        IoError,
        InvalidFormat,
        InvalidArgument
    };

    Code code = Code::None;
    std::string message;
    std::string context;  // Strategy / layout / file the error belongs to

    Error() = default;
    Error(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(Code c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    bool ok() const { return code == Code::None; }

    std::string full_message() const {
        if (context.empty()) {
            return message;
        }
        return message + " [" + context + "]";
    }

    static Error malformed_header(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::MalformedHeader, msg, ctx);
    }

    static Error decompression_failure(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::DecompressionFailure, msg, ctx);
    }

    static Error size_mismatch(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::SizeMismatch, msg, ctx);
    }

    static Error index_not_found(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::IndexRegionNotFound, msg, ctx);
    }

    static Error implausible(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::ImplausibleResult, msg, ctx);
    }

    static Error file_not_found(const std::string& path) {
        return Error(Code::FileNotFound, "File not found", path);
    }

    static Error io_error(const std::string& msg, const std::string& path = "") {
        return Error(Code::IoError, msg, path);
    }

    static Error invalid_format(const std::string& msg, const std::string& path = "") {
        return Error(Code::InvalidFormat, msg, path);
    }
};

/**
 * Human readable name of an error code (used in reports and logs).
 */
constexpr const char* error_code_string(Error::Code code) {
    switch (code) {
        case Error::Code::None:                 return "None";
        case Error::Code::MalformedHeader:      return "MalformedHeader";
        case Error::Code::DecompressionFailure: return "DecompressionFailure";
        case Error::Code::SizeMismatch:         return "SizeMismatch";
        case Error::Code::IndexRegionNotFound:  return "IndexRegionNotFound";
        case Error::Code::ImplausibleResult:    return "ImplausibleResult";
        case Error::Code::AllStrategiesFailed:  return "AllStrategiesFailed";
        case Error::Code::CodecUnavailable:     return "CodecUnavailable";
        case Error::Code::FileNotFound:         return "FileNotFound";
        case Error::Code::IoError:              return "IoError";
        case Error::Code::InvalidFormat:        return "InvalidFormat";
        case Error::Code::InvalidArgument:      return "InvalidArgument";
        default:                                return "Unknown";
    }
}

/**
 * Result type that holds either a value T or an Error
 *
 * Usage:
 *   Result<std::vector<uint8_t>> payload = decompress_block(block);
 *   if (!payload) {
 *       LOG_DEBUG("Strategy", payload.error().full_message());
 *       return payload.error();
 *   }
 */
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    bool has_value() const { return ok(); }
    explicit operator bool() const { return ok(); }

    // Access value (throws if error)
    T& value() {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }

    T value_or(T default_value) const {
        if (ok()) {
            return std::get<T>(data_);
        }
        return default_value;
    }

    const Error& error() const {
        if (ok()) {
            static Error no_error;
            return no_error;
        }
        return std::get<Error>(data_);
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    std::optional<T> to_optional() const {
        if (ok()) {
            return std::get<T>(data_);
        }
        return std::nullopt;
    }

private:
    std::variant<T, Error> data_;
};

/**
 * Specialization for void results (just success/failure)
 */
template<>
class Result<void> {
public:
    Result() : error_(std::nullopt) {}
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const {
        static Error no_error;
        return error_ ? *error_ : no_error;
    }

    static Result success() { return Result(); }
    static Result failure(Error err) { return Result(std::move(err)); }

private:
    std::optional<Error> error_;
};

// Early return on error
#define SKYMESH_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (!_result.ok()) { \
            return _result.error(); \
        } \
    } while(0)

#define SKYMESH_TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (!_result_##var.ok()) { \
        return _result_##var.error(); \
    } \
    auto var = std::move(_result_##var.value())

} // namespace skymesh
