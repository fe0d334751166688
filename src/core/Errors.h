#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Root of the uts exception hierarchy.
 *
 * Exceptions are reserved for infrastructure failures (I/O, storage, plugins).
 * Domain validation failures travel as result structs (RegisterResult, ApplyResult).
 */
class UtsError : public std::runtime_error {
public:
    explicit UtsError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief One tool's discovery failed. Contained per tool by DiscoveryRunner.
 */
class PluginDiscoveryError : public UtsError {
public:
    PluginDiscoveryError(const std::string& tool, const std::string& message)
        : UtsError("[" + tool + "] " + message), tool(tool) {}

    const std::string& getTool() const { return tool; }

private:
    std::string tool;
};

/**
 * @brief Storage or lock failure. The failed operation has been rolled back.
 */
class PersistenceError : public UtsError {
public:
    explicit PersistenceError(const std::string& message) : UtsError(message) {}
};

/**
 * @brief Invalid or unreadable configuration file.
 */
class ConfigError : public UtsError {
public:
    explicit ConfigError(const std::string& message) : UtsError(message) {}
};

/**
 * @brief A decision document could not be parsed.
 */
class DecisionFormatError : public UtsError {
public:
    explicit DecisionFormatError(const std::string& message) : UtsError(message) {}
};
