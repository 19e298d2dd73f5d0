#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <utility>

namespace rg {

enum class ErrorCode : std::int32_t {
    Ok = 0,
    Unknown = 1,
    ResourceExhausted = 3,
    ArithmeticDomain = 12,
    CorruptChunk = 20,
    IO = 30,
    Config = 40,
};

class Exception : public std::exception {
public:
    Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] const char* what() const noexcept override { return msg_.c_str(); }
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return msg_; }

private:
    ErrorCode code_;
    std::string msg_;
};

// Eviction could not restore headroom, or an allocation kept failing.
class ResourceExhaustedError : public Exception {
public:
    explicit ResourceExhaustedError(const std::string& msg)
        : Exception(ErrorCode::ResourceExhausted, msg) {}
};

// A stored chunk blob does not describe the chunk it was loaded for.
class CorruptChunkError : public Exception {
public:
    explicit CorruptChunkError(const std::string& msg)
        : Exception(ErrorCode::CorruptChunk, "Corrupt chunk: " + msg) {}
};

class ArithmeticDomainError : public Exception {
public:
    explicit ArithmeticDomainError(const std::string& msg)
        : Exception(ErrorCode::ArithmeticDomain, msg) {}
};

class IOError : public Exception {
public:
    explicit IOError(const std::string& msg)
        : Exception(ErrorCode::IO, msg) {}
};

class ConfigError : public Exception {
public:
    explicit ConfigError(const std::string& msg)
        : Exception(ErrorCode::Config, msg) {}
};

} // namespace rg
