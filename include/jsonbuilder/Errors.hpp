/**
 * @file Errors.hpp
 * @brief Exception types for document building errors
 *
 * Error taxonomy:
 * - BuildError: Base class, the single kind put/build callers catch
 * - DecodeError: Malformed embedded or materialized text
 * - EncodeError: Materialization or re-encoding failure
 * - PathResolutionError: Path segment not found
 * - PathTypeError: Path runs into a node of the wrong kind
 */

#ifndef JSONBUILDER_ERRORS_HPP
#define JSONBUILDER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace jsonbuilder {

/**
 * @brief Base class for all jsonbuilder exceptions
 */
class BuildError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Text could not be decoded into a Node
 */
class DecodeError : public BuildError {
public:
    /**
     * @brief Construct with offending text and parser details
     * @param text The text that failed to decode
     * @param details Detailed error message from the codec
     */
    DecodeError(std::string text, std::string details)
        : BuildError("Decode error: " + details)
        , text_(std::move(text))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the text that failed to decode
     */
    const std::string& text() const noexcept {
        return text_;
    }

    /**
     * @brief Get detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string text_;
    std::string details_;
};

/**
 * @brief A Node or mapping could not be encoded
 */
class EncodeError : public BuildError {
public:
    explicit EncodeError(std::string details)
        : BuildError("Encode error: " + details)
        , details_(std::move(details))
    {}

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string details_;
};

/**
 * @brief Segment not found while resolving a path
 *
 * Raised by erase/lookup when any segment of the path is absent.
 * JsonBuilder::remove() absorbs it.
 */
class PathResolutionError : public BuildError {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full path being resolved (e.g., "$.user.name")
     * @param segment The specific segment that doesn't exist (e.g., "name")
     */
    PathResolutionError(std::string path, std::string segment)
        : BuildError("Path not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Kind mismatch while walking a path
 *
 * Raised when a put has to descend through a scalar or null, or when
 * an array-append segment addresses an existing non-array node. The
 * existing node is left untouched.
 */
class PathTypeError : public BuildError {
public:
    /**
     * @brief Construct with path, expected kind, and actual kind
     * @param path Full path being written
     * @param expected Expected kind (e.g., "object or array")
     * @param actual Kind encountered (e.g., "string")
     */
    PathTypeError(std::string path, std::string expected, std::string actual)
        : BuildError("Cannot write through " + actual +
                     " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

} // namespace jsonbuilder

#endif // JSONBUILDER_ERRORS_HPP
