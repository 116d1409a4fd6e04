#pragma once

#include <stdexcept>
#include <string>

namespace undostack {

/**
 * Base exception class for all undostack errors
 */
class UndoStackException : public std::runtime_error {
  public:
    explicit UndoStackException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Exception for configuration validation errors
 */
class ConfigError : public UndoStackException {
  public:
    explicit ConfigError(const std::string &message)
        : UndoStackException("Configuration error: " + message) {}
};

/**
 * Exception for I/O operations (file read/write, JSON parsing)
 */
class IOError : public UndoStackException {
  public:
    explicit IOError(const std::string &message)
        : UndoStackException("I/O error: " + message) {}
};

} // namespace undostack
