/**
 * @file Element.hpp
 * @brief Value model for patched documents
 *
 * An Element is one of:
 * - Null
 * - Boolean (true | false)
 * - Number (int64_t, uint64_t or double, compared by numeric value)
 * - String (std::string, UTF-8)
 * - Array ([Element, ...])
 * - Object ({String: Element, ...}, insertion ordered)
 *
 * Containers are reference counted nodes. Each container handle carries an
 * ownership tag: a *shared* handle may alias other trees and is never
 * written through; an *exclusive* handle was allocated by the patch engine
 * for the path it is currently mutating. An exclusive handle is the only
 * handle to its node: copying it demotes both the copy and the source (and
 * every exclusive handle below the source) to shared. Only Document writes
 * through exclusive handles.
 */

#ifndef JPATCH_ELEMENT_HPP
#define JPATCH_ELEMENT_HPP

#include "jpatch/MemberMap.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace jpatch {

/**
 * @brief Decoded JSON as handed over by nlohmann/json
 *
 * The ordered flavour keeps object members in document order so that
 * serialization reproduces the input layout.
 */
using Json = nlohmann::ordered_json;

class Document;

/**
 * @brief Exact JSON number
 *
 * Keeps the representation the decoder produced. Equality is numeric:
 * Number(std::int64_t{1}) == Number(1.0).
 */
class Number {
public:
    enum class Kind { Integer, Unsigned, Float };

    Number() = default;
    explicit Number(std::int64_t value) noexcept : kind_(Kind::Integer), integer_(value) {}
    explicit Number(std::uint64_t value) noexcept : kind_(Kind::Unsigned), unsigned_(value) {}
    explicit Number(double value) noexcept : kind_(Kind::Float), float_(value) {}

    Kind kind() const noexcept { return kind_; }
    bool is_integral() const noexcept { return kind_ != Kind::Float; }

    std::int64_t as_integer() const noexcept { return integer_; }
    std::uint64_t as_unsigned() const noexcept { return unsigned_; }
    double as_double() const noexcept;

    friend bool operator==(const Number& lhs, const Number& rhs) noexcept;
    friend bool operator!=(const Number& lhs, const Number& rhs) noexcept {
        return !(lhs == rhs);
    }

private:
    Kind kind_ = Kind::Integer;
    std::int64_t integer_ = 0;
    std::uint64_t unsigned_ = 0;
    double float_ = 0.0;
};

/**
 * @brief Node of a JSON document tree with copy-on-write containers
 */
class Element {
public:
    enum class Type { Null, Boolean, Number, String, Array, Object };

    using Array = std::vector<Element>;
    using Object = MemberMap<std::string, Element>;

    Element() noexcept : data_(nullptr) {}
    Element(std::nullptr_t) noexcept : data_(nullptr) {}
    Element(bool value) noexcept : data_(value) {}
    Element(Number value) noexcept : data_(value) {}
    Element(double value) noexcept : data_(Number(value)) {}
    Element(std::string value) : data_(std::move(value)) {}
    Element(const char* value) : data_(std::string(value)) {}

    template <typename T,
              typename std::enable_if<std::is_integral<T>::value &&
                                      !std::is_same<T, bool>::value, int>::type = 0>
    Element(T value) noexcept
        : data_(std::is_signed<T>::value
                    ? Number(static_cast<std::int64_t>(value))
                    : Number(static_cast<std::uint64_t>(value))) {}

    /**
     * @brief Copy a handle
     *
     * The copy aliases the same container node. Once aliased a node is
     * read-only, so @p other is demoted to shared as well.
     */
    Element(const Element& other) : data_(other.data_) {
        other.release_exclusive();
    }
    Element& operator=(const Element& other) {
        // other may live inside the node this handle releases
        Element copy(other);
        data_ = std::move(copy.data_);
        exclusive_ = false;
        return *this;
    }

    /**
     * @brief Move a handle, keeping its ownership tag
     *
     * The moved-from handle becomes Null.
     */
    Element(Element&& other) noexcept
        : data_(std::move(other.data_)), exclusive_(other.exclusive_) {
        other.data_ = nullptr;
        other.exclusive_ = false;
    }
    Element& operator=(Element&& other) noexcept {
        if (this != &other) {
            auto data = std::move(other.data_);
            const bool exclusive = other.exclusive_;
            other.data_ = nullptr;
            other.exclusive_ = false;
            data_ = std::move(data);
            exclusive_ = exclusive;
        }
        return *this;
    }

    ~Element() = default;

    /**
     * @brief Build a shared array from its items
     *
     * The items are demoted to shared along with the new node.
     */
    static Element array(Array items = {});

    /**
     * @brief Build a shared object from its members
     */
    static Element object(Object members = {});

    /**
     * @brief Wrap a decoded JSON value
     *
     * @param json Value produced by nlohmann/json
     * @return Element tree with shared containers
     * @throws InvalidObjectType for binary or discarded values
     *
     * Examples:
     * ```cpp
     * auto e = Element::from_json(Json::parse(R"({"a": [1, 2]})"));
     * e.as_object().at("a").size();  // 2
     * ```
     */
    static Element from_json(const Json& json);

    /**
     * @brief Convert back into a decoded JSON value
     */
    Json to_json() const;

    Type type() const noexcept { return static_cast<Type>(data_.index()); }

    bool is_null() const noexcept { return type() == Type::Null; }
    bool is_boolean() const noexcept { return type() == Type::Boolean; }
    bool is_number() const noexcept { return type() == Type::Number; }
    bool is_string() const noexcept { return type() == Type::String; }
    bool is_array() const noexcept { return type() == Type::Array; }
    bool is_object() const noexcept { return type() == Type::Object; }
    bool is_container() const noexcept { return is_array() || is_object(); }

    /**
     * @brief True only for exclusive container handles
     */
    bool is_mutable() const noexcept { return exclusive_ && is_container(); }

    // Accessors; calling one for the wrong type throws std::bad_variant_access.
    bool as_bool() const { return std::get<bool>(data_); }
    const Number& as_number() const { return std::get<Number>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const Array& as_array() const { return *std::get<ArrayPtr>(data_); }
    const Object& as_object() const { return *std::get<ObjectPtr>(data_); }

    /**
     * @brief Number of children of a container, 0 for scalars
     */
    std::size_t size() const noexcept;

    /**
     * @brief Exclusive copy of the immediate structure
     *
     * A new container node is allocated holding shared handles to the same
     * children, so promotion costs one level, not the whole subtree.
     * Scalars are returned as plain copies.
     */
    Element to_exclusive() const;

    /**
     * @brief Exclusive copy of the whole subtree
     *
     * No node of the result is shared with this tree.
     */
    Element deep_clone() const;

    friend bool operator==(const Element& lhs, const Element& rhs);
    friend bool operator!=(const Element& lhs, const Element& rhs) {
        return !(lhs == rhs);
    }

private:
    friend class Document;

    using ArrayPtr = std::shared_ptr<Array>;
    using ObjectPtr = std::shared_ptr<Object>;

    // Writable storage; only valid on exclusive handles.
    Array& array_storage();
    Object& object_storage();

    // Clears the tag here and on every exclusive handle below.
    void release_exclusive() const noexcept;

    // Alternatives are ordered like Type.
    std::variant<std::nullptr_t, bool, Number, std::string, ArrayPtr, ObjectPtr> data_;
    mutable bool exclusive_ = false;
};

/**
 * @brief Get human-readable type name for an Element
 * @return "null", "boolean", "number", "string", "array" or "object"
 */
std::string type_name(const Element& element);

} // namespace jpatch

#endif // JPATCH_ELEMENT_HPP
