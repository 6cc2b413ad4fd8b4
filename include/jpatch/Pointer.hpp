/**
 * @file Pointer.hpp
 * @brief RFC 6901 JSON Pointer
 *
 * A pointer is an ordered list of reference tokens. In its string form each
 * token is prefixed with '/', and '~' and '/' inside a token are escaped as
 * "~0" and "~1". The empty string refers to the whole document.
 *
 * Examples:
 * - ""          → []
 * - "/a/b"      → ["a", "b"]
 * - "/a~1b/~0"  → ["a/b", "~"]
 * - "/"         → [""]
 */

#ifndef JPATCH_POINTER_HPP
#define JPATCH_POINTER_HPP

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace jpatch {

/**
 * @brief Parsed JSON Pointer
 */
class Pointer {
public:
    /**
     * @brief The root pointer ("")
     */
    Pointer() = default;

    /**
     * @brief Build a pointer from unescaped reference tokens
     */
    explicit Pointer(std::vector<std::string> tokens);

    /**
     * @brief Parse a pointer string
     *
     * @param raw Pointer string such as "/a/0"
     * @return Parsed pointer
     * @throws InvalidPointerSyntax if raw is neither empty nor starts with
     *         '/', or contains '~' not followed by '0' or '1'
     *
     * Examples:
     * ```cpp
     * Pointer::parse("/foo/0").tokens();  // ["foo", "0"]
     * Pointer::parse("foo");              // Throws InvalidPointerSyntax
     * ```
     */
    static Pointer parse(const std::string& raw);

    const std::vector<std::string>& tokens() const noexcept { return tokens_; }

    /**
     * @brief Escaped string form, as it would appear in a patch document
     */
    const std::string& str() const noexcept { return raw_; }

    bool is_root() const noexcept { return tokens_.empty(); }

    /**
     * @brief Pointer with the last token removed, nullopt for the root
     */
    std::optional<Pointer> parent() const;

    /**
     * @brief Last reference token
     * @pre !is_root()
     */
    const std::string& back() const { return tokens_.back(); }

    Pointer append(const std::string& token) const;
    Pointer concat(const Pointer& suffix) const;

    /**
     * @brief True if every token of this pointer starts @p other
     *
     * A pointer is a prefix of itself; the root is a prefix of everything.
     */
    bool is_prefix_of(const Pointer& other) const;

    /**
     * @brief Check whether a token can address an array element
     *
     * Valid tokens are "0" or a non-zero digit followed by digits. Leading
     * zeros, signs and "-" are rejected ("-" is handled separately).
     */
    static bool is_valid_array_index(const std::string& token);

    static std::string escape(const std::string& token);
    static std::string unescape(const std::string& token);

    friend bool operator==(const Pointer& lhs, const Pointer& rhs) {
        return lhs.tokens_ == rhs.tokens_;
    }
    friend bool operator!=(const Pointer& lhs, const Pointer& rhs) {
        return !(lhs == rhs);
    }

private:
    std::vector<std::string> tokens_;
    std::string raw_;
};

std::ostream& operator<<(std::ostream& os, const Pointer& pointer);

} // namespace jpatch

#endif // JPATCH_POINTER_HPP
