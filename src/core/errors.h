#pragma once

#include <stdexcept>
#include <string>

namespace core {

/**
 * @brief Malformed or inconsistent field/scenario metadata. Fatal at setup.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Artifact directory unwritable, path conflicts, or writes to a sealed run.
 */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Checksum mismatch or malformed delta/checkpoint data on read.
 */
class CorruptionError : public std::runtime_error {
public:
    explicit CorruptionError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Requested tick, field, cell or file lies outside what was recorded.
 */
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Operation called in the wrong lifecycle state (e.g. query before load).
 */
class StateError : public std::runtime_error {
public:
    explicit StateError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace core
