#pragma once

#include <stdexcept>
#include <string>

namespace kernelbench {

/**
 * Base exception class for all kernelbench errors
 */
class KernelBenchException : public std::runtime_error {
  public:
    explicit KernelBenchException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Exception for kernel precondition violations (mismatched inputs, invalid
 * grid bounds, zero-radius particles)
 */
class KernelError : public KernelBenchException {
  public:
    explicit KernelError(const std::string &message)
        : KernelBenchException("Kernel error: " + message) {}
};

/**
 * Exception for configuration validation errors
 */
class ConfigError : public KernelBenchException {
  public:
    explicit ConfigError(const std::string &message)
        : KernelBenchException("Configuration error: " + message) {}
};

/**
 * Exception for I/O operations (config file read, JSON parsing)
 */
class IOError : public KernelBenchException {
  public:
    explicit IOError(const std::string &message)
        : KernelBenchException("I/O error: " + message) {}
};

/**
 * Exception for viewer rendering errors
 */
class RenderError : public KernelBenchException {
  public:
    explicit RenderError(const std::string &message)
        : KernelBenchException("Render error: " + message) {}
};

} // namespace kernelbench
