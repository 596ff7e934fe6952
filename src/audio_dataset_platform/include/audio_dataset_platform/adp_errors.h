#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace adp {

// ADP-owned error codes (no FFmpeg codes escape)
enum class ErrorCode {
    Ok,
    OpenFailed,
    NoAudioStream,
    UnsupportedCodec,
    DecodeFailed,
    ResamplerInitFailed,
    WriteFailed,
    AllocationFailed,
    DirectoryCreateFailed,
    InputEnumerationFailed,
    InvalidConfig,
    InvalidArg,
    Internal
};

// Convert error code to string (for log lines and the batch summary)
inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                     return "Ok";
        case ErrorCode::OpenFailed:             return "OpenFailed";
        case ErrorCode::NoAudioStream:          return "NoAudioStream";
        case ErrorCode::UnsupportedCodec:       return "UnsupportedCodec";
        case ErrorCode::DecodeFailed:           return "DecodeFailed";
        case ErrorCode::ResamplerInitFailed:    return "ResamplerInitFailed";
        case ErrorCode::WriteFailed:            return "WriteFailed";
        case ErrorCode::AllocationFailed:       return "AllocationFailed";
        case ErrorCode::DirectoryCreateFailed:  return "DirectoryCreateFailed";
        case ErrorCode::InputEnumerationFailed: return "InputEnumerationFailed";
        case ErrorCode::InvalidConfig:          return "InvalidConfig";
        case ErrorCode::InvalidArg:             return "InvalidArg";
        case ErrorCode::Internal:               return "Internal";
    }
    return "Unknown";
}

// Error with context message
struct Error {
    ErrorCode code;
    std::string message;

    static Error ok() { return {ErrorCode::Ok, ""}; }
    static Error open_failed(const std::string& detail) {
        return {ErrorCode::OpenFailed, detail};
    }
    static Error no_audio_stream(const std::string& path) {
        return {ErrorCode::NoAudioStream, "No audio stream in " + path};
    }
    static Error unsupported_codec(const std::string& detail) {
        return {ErrorCode::UnsupportedCodec, detail};
    }
    static Error decode_failed(const std::string& detail) {
        return {ErrorCode::DecodeFailed, detail};
    }
    static Error resampler_init_failed(const std::string& detail) {
        return {ErrorCode::ResamplerInitFailed, detail};
    }
    static Error write_failed(const std::string& detail) {
        return {ErrorCode::WriteFailed, detail};
    }
    static Error allocation_failed(const std::string& what) {
        return {ErrorCode::AllocationFailed, "Allocation failed: " + what};
    }
    static Error directory_create_failed(const std::string& dir) {
        return {ErrorCode::DirectoryCreateFailed, "Cannot create directory: " + dir};
    }
    static Error input_enumeration_failed(const std::string& detail) {
        return {ErrorCode::InputEnumerationFailed, detail};
    }
    static Error invalid_config(const std::string& detail) {
        return {ErrorCode::InvalidConfig, detail};
    }
    static Error invalid_arg(const std::string& detail) {
        return {ErrorCode::InvalidArg, detail};
    }
    static Error internal(const std::string& detail) {
        return {ErrorCode::Internal, detail};
    }
};

// Result type: either value T or Error
template<typename T>
class Result {
public:
    // Success constructor
    Result(T value) : m_data(std::move(value)) {}

    // Error constructor
    Result(Error error) : m_data(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(m_data); }
    bool is_error() const { return std::holds_alternative<Error>(m_data); }

    // Access value (throws std::bad_variant_access if error)
    T& value() { return std::get<T>(m_data); }
    const T& value() const { return std::get<T>(m_data); }

    // Access error (throws std::bad_variant_access if ok)
    Error& error() { return std::get<Error>(m_data); }
    const Error& error() const { return std::get<Error>(m_data); }

    // Unwrap value or throw (for convenience)
    T unwrap() {
        if (is_error()) {
            throw std::runtime_error(error().message);
        }
        return std::move(value());
    }

private:
    std::variant<T, Error> m_data;
};

// Specialization for void result
template<>
class Result<void> {
public:
    Result() : m_error(std::nullopt) {}
    Result(Error error) : m_error(std::move(error)) {}

    bool is_ok() const { return !m_error.has_value(); }
    bool is_error() const { return m_error.has_value(); }

    Error& error() { return *m_error; }
    const Error& error() const { return *m_error; }

private:
    std::optional<Error> m_error;
};

} // namespace adp
