/**
 * @file Errors.hpp
 * @brief Exception types for jpatch pointer and patch errors
 *
 * Error taxonomy:
 * - PatchError: Base class
 * - InvalidObjectType: Decoded value has no Element representation
 * - InvalidPointerSyntax: Malformed JSON Pointer string
 * - ReferencesNonexistentValue: Pointer does not resolve
 * - InvalidMoveTarget: Move into the moved value's own children
 * - PatchTestFailed: "test" operation mismatch
 * - InvalidPatchFormat / UnknownPatchOperation / MissingRequiredPatchField:
 *   Malformed patch documents
 * - FileNotFoundError / DocumentParseError / UnsupportedFormatError: File IO
 */

#ifndef JPATCH_ERRORS_HPP
#define JPATCH_ERRORS_HPP

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <optional>
#include <cstddef>

namespace jpatch {

/**
 * @brief Base class for all jpatch exceptions
 *
 * When raised while applying a Patch, the zero-based index of the failing
 * operation is attached before the exception is rethrown.
 */
class PatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /**
     * @brief Index of the operation that failed, if raised by Patch::apply
     */
    std::optional<std::size_t> operation_index() const noexcept {
        return operation_index_;
    }

    void set_operation_index(std::size_t index) noexcept {
        operation_index_ = index;
    }

private:
    std::optional<std::size_t> operation_index_;
};

/**
 * @brief A decoded value cannot be represented as an Element
 */
class InvalidObjectType : public PatchError {
public:
    /**
     * @brief Construct with the offending type name
     * @param type_name Name of the unsupported type (e.g., "binary")
     */
    explicit InvalidObjectType(std::string type_name)
        : PatchError("Invalid object type: " + type_name)
        , type_name_(std::move(type_name))
    {}

    const std::string& type_name() const noexcept {
        return type_name_;
    }

private:
    std::string type_name_;
};

/**
 * @brief JSON Pointer string is malformed
 */
class InvalidPointerSyntax : public PatchError {
public:
    /**
     * @brief Construct with the raw pointer and a reason
     * @param pointer The raw pointer string
     * @param reason What is wrong with it
     */
    InvalidPointerSyntax(std::string pointer, const std::string& reason)
        : PatchError("Invalid JSON pointer '" + pointer + "': " + reason)
        , pointer_(std::move(pointer))
    {}

    const std::string& pointer() const noexcept {
        return pointer_;
    }

private:
    std::string pointer_;
};

/**
 * @brief Pointer references a value that does not exist
 *
 * Raised for missing keys, out-of-range or malformed array indices,
 * traversal through scalars, and removal of the document root by move.
 */
class ReferencesNonexistentValue : public PatchError {
public:
    /**
     * @brief Construct with the pointer and the failing token
     * @param path Pointer being evaluated (e.g., "/a/b")
     * @param token Reference token that could not be resolved
     */
    ReferencesNonexistentValue(std::string path, std::string token)
        : PatchError("Pointer '" + path + "' references a nonexistent value at '" + token + "'")
        , path_(std::move(path))
        , token_(std::move(token))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& token() const noexcept {
        return token_;
    }

private:
    std::string path_;
    std::string token_;
};

/**
 * @brief Move whose destination lies inside the value being moved
 */
class InvalidMoveTarget : public PatchError {
public:
    InvalidMoveTarget(std::string from, std::string path)
        : PatchError("Cannot move '" + from + "' into its own child '" + path + "'")
        , from_(std::move(from))
        , path_(std::move(path))
    {}

    const std::string& from() const noexcept {
        return from_;
    }

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string from_;
    std::string path_;
};

/**
 * @brief "test" operation found a different value (or none)
 */
class PatchTestFailed : public PatchError {
public:
    /**
     * @brief Construct with the tested location and both values
     * @param path Pointer that was tested
     * @param expected Value the patch expected
     * @param found Value actually present; nullopt if the path did not resolve
     */
    PatchTestFailed(std::string path, nlohmann::ordered_json expected,
                    std::optional<nlohmann::ordered_json> found)
        : PatchError(format_message(path, expected, found))
        , path_(std::move(path))
        , expected_(std::move(expected))
        , found_(std::move(found))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const nlohmann::ordered_json& expected() const noexcept {
        return expected_;
    }

    const std::optional<nlohmann::ordered_json>& found() const noexcept {
        return found_;
    }

private:
    std::string path_;
    nlohmann::ordered_json expected_;
    std::optional<nlohmann::ordered_json> found_;

    static std::string format_message(const std::string& path,
                                      const nlohmann::ordered_json& expected,
                                      const std::optional<nlohmann::ordered_json>& found) {
        std::string msg = "Test failed at '" + path + "': expected " + expected.dump();
        if (found) {
            msg += ", found " + found->dump();
        } else {
            msg += ", found no value";
        }
        return msg;
    }
};

/**
 * @brief Patch document is not an array of operation objects
 */
class InvalidPatchFormat : public PatchError {
public:
    explicit InvalidPatchFormat(std::string details)
        : PatchError("Invalid patch format: " + details)
        , details_(std::move(details))
    {}

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string details_;
};

/**
 * @brief Operation object names an unknown "op"
 */
class UnknownPatchOperation : public PatchError {
public:
    UnknownPatchOperation(std::string op, std::size_t index)
        : PatchError("Unknown patch operation '" + op + "' at index " + std::to_string(index))
        , op_(std::move(op))
        , index_(index)
    {}

    const std::string& op() const noexcept {
        return op_;
    }

    std::size_t index() const noexcept {
        return index_;
    }

private:
    std::string op_;
    std::size_t index_;
};

/**
 * @brief Operation object lacks a member its "op" requires
 */
class MissingRequiredPatchField : public PatchError {
public:
    /**
     * @brief Construct with operation name, position and missing member
     * @param op Operation name (e.g., "move")
     * @param index Position of the operation in the patch
     * @param field Missing member (e.g., "from")
     */
    MissingRequiredPatchField(std::string op, std::size_t index, std::string field)
        : PatchError("Patch operation '" + op + "' at index " + std::to_string(index) +
                     " is missing required field '" + field + "'")
        , op_(std::move(op))
        , index_(index)
        , field_(std::move(field))
    {}

    const std::string& op() const noexcept {
        return op_;
    }

    std::size_t index() const noexcept {
        return index_;
    }

    const std::string& field() const noexcept {
        return field_;
    }

private:
    std::string op_;
    std::size_t index_;
    std::string field_;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public PatchError {
public:
    explicit FileNotFoundError(std::string path)
        : PatchError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief JSON/TOML text could not be decoded
 */
class DocumentParseError : public PatchError {
public:
    /**
     * @brief Construct with source name and parser message
     * @param source File path or "<string>" for in-memory text
     * @param details Message from the underlying parser
     */
    DocumentParseError(std::string source, std::string details)
        : PatchError("Parse error in '" + source + "': " + details)
        , source_(std::move(source))
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept {
        return source_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    std::string details_;
};

/**
 * @brief File format unknown, or unable to hold the document
 */
class UnsupportedFormatError : public PatchError {
public:
    explicit UnsupportedFormatError(const std::string& details)
        : PatchError("Unsupported format: " + details)
    {}
};

} // namespace jpatch

#endif // JPATCH_ERRORS_HPP
