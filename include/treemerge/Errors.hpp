/**
 * @file Errors.hpp
 * @brief Exception types for treemerge precondition and configuration errors
 *
 * Error taxonomy:
 * - MergeError: Base class
 * - InvalidRootError: Source/destination root unusable
 * - InvalidPathError: Relative path absolute or escaping its root
 * - ConfigError: Base for configuration problems
 *   - ConfigFileNotFound: Config file not found
 *   - ConfigParseError: JSON/TOML syntax errors
 *   - InvalidOptionError: Option present but wrong type or value
 *
 * Per-file copy failures are not exceptions; they travel as
 * FailureKind values inside MergeOutcome (see Types.hpp).
 */

#ifndef TREEMERGE_ERRORS_HPP
#define TREEMERGE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace treemerge {

/**
 * @brief Base class for all treemerge exceptions
 */
class MergeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A directory root violates its invariants
 *
 * Raised when a root does not exist, is not a directory, cannot be
 * listed, or when the destination overlaps a source root.
 */
class InvalidRootError : public MergeError {
public:
    /**
     * @brief Construct with offending path and reason
     * @param path Root path as given by the caller
     * @param reason Human readable reason
     */
    InvalidRootError(std::string path, std::string reason)
        : MergeError("Invalid root '" + path + "': " + reason)
        , path_(std::move(path))
        , reason_(std::move(reason))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    std::string path_;
    std::string reason_;
};

/**
 * @brief A relative path cannot be represented safely
 */
class InvalidPathError : public MergeError {
public:
    InvalidPathError(std::string path, std::string reason)
        : MergeError("Invalid relative path '" + path + "': " + reason)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Base class for configuration errors
 */
class ConfigError : public MergeError {
public:
    using MergeError::MergeError;
};

/**
 * @brief Configuration file not found
 */
class ConfigFileNotFound : public ConfigError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit ConfigFileNotFound(std::string path)
        : ConfigError("Configuration file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Configuration file parse error (JSON/TOML syntax)
 */
class ConfigParseError : public ConfigError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the file with parse error
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, std::string details)
        : ConfigError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief Option has the wrong type or an unacceptable value
 *
 * Raised while converting the merged configuration document into
 * MergeOptions / LogSettings (e.g. concurrency of 0, unknown policy).
 */
class InvalidOptionError : public ConfigError {
public:
    /**
     * @brief Construct with option key and reason
     * @param key Dot-path of the option (e.g., "logging.level")
     * @param reason What is wrong with it
     */
    InvalidOptionError(std::string key, std::string reason)
        : ConfigError("Invalid option '" + key + "': " + reason)
        , key_(std::move(key))
        , reason_(std::move(reason))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    std::string key_;
    std::string reason_;
};

} // namespace treemerge

#endif // TREEMERGE_ERRORS_HPP
