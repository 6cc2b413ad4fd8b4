/**
 * @file Pointer.cpp
 * @brief Implementation of JSON Pointer parsing
 */

#include "jpatch/Pointer.hpp"
#include "jpatch/Errors.hpp"
#include <algorithm>
#include <cctype>

namespace jpatch {

namespace {
    /**
     * @brief Build the escaped string form from tokens
     */
    std::string join_tokens(const std::vector<std::string>& tokens) {
        std::string raw;
        for (const auto& token : tokens) {
            raw += '/';
            raw += Pointer::escape(token);
        }
        return raw;
    }

    /**
     * @brief Check that every '~' is followed by '0' or '1'
     */
    bool has_valid_escapes(const std::string& token) {
        for (size_t i = 0; i < token.size(); ++i) {
            if (token[i] != '~') continue;
            if (i + 1 >= token.size()) return false;
            if (token[i + 1] != '0' && token[i + 1] != '1') return false;
        }
        return true;
    }
}

Pointer::Pointer(std::vector<std::string> tokens)
    : tokens_(std::move(tokens))
    , raw_(join_tokens(tokens_))
{}

Pointer Pointer::parse(const std::string& raw) {
    if (raw.empty()) {
        return Pointer();
    }

    if (raw.front() != '/') {
        throw InvalidPointerSyntax(raw, "must be empty or start with '/'");
    }

    std::vector<std::string> tokens;
    size_t start = 1;

    while (true) {
        size_t end = raw.find('/', start);
        std::string token = raw.substr(start, end == std::string::npos ? std::string::npos : end - start);

        if (!has_valid_escapes(token)) {
            throw InvalidPointerSyntax(raw, "'~' must be followed by '0' or '1'");
        }
        tokens.push_back(unescape(token));

        if (end == std::string::npos) break;
        start = end + 1;
    }

    Pointer pointer;
    pointer.tokens_ = std::move(tokens);
    pointer.raw_ = raw;
    return pointer;
}

std::optional<Pointer> Pointer::parent() const {
    if (tokens_.empty()) {
        return std::nullopt;
    }
    return Pointer(std::vector<std::string>(tokens_.begin(), tokens_.end() - 1));
}

Pointer Pointer::append(const std::string& token) const {
    std::vector<std::string> tokens = tokens_;
    tokens.push_back(token);
    return Pointer(std::move(tokens));
}

Pointer Pointer::concat(const Pointer& suffix) const {
    std::vector<std::string> tokens = tokens_;
    tokens.insert(tokens.end(), suffix.tokens_.begin(), suffix.tokens_.end());
    return Pointer(std::move(tokens));
}

bool Pointer::is_prefix_of(const Pointer& other) const {
    if (tokens_.size() > other.tokens_.size()) {
        return false;
    }
    return std::equal(tokens_.begin(), tokens_.end(), other.tokens_.begin());
}

bool Pointer::is_valid_array_index(const std::string& token) {
    if (token.empty()) return false;
    // No leading zeros except "0" itself
    if (token[0] == '0' && token.size() > 1) return false;
    return std::all_of(token.begin(), token.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string Pointer::escape(const std::string& token) {
    std::string result;
    result.reserve(token.size());
    for (char c : token) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result += c;
        }
    }
    return result;
}

std::string Pointer::unescape(const std::string& token) {
    std::string result;
    result.reserve(token.size());
    for (size_t i = 0; i < token.size(); ++i) {
        if (token[i] == '~' && i + 1 < token.size()) {
            // "~01" must decode to "~1", so each escape is consumed exactly once
            if (token[i + 1] == '1') {
                result += '/';
                ++i;
                continue;
            }
            if (token[i + 1] == '0') {
                result += '~';
                ++i;
                continue;
            }
        }
        result += token[i];
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const Pointer& pointer) {
    return os << pointer.str();
}

} // namespace jpatch
