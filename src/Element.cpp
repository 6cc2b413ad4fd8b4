/**
 * @file Element.cpp
 * @brief Implementation of the value model
 */

#include "jpatch/Element.hpp"
#include "jpatch/Errors.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace jpatch {

// Growing or shifting a container must move its handles, never copy them:
// a copy would demote the exclusive children below it.
static_assert(std::is_nothrow_move_constructible<Element>::value,
              "Element must relocate by move");
static_assert(std::is_nothrow_move_constructible<Element::Object::value_type>::value,
              "object members must relocate by move");

namespace {
    /**
     * @brief Compare a double with a signed integer without rounding either
     */
    bool float_equals_integer(double d, std::int64_t i) {
        if (!std::isfinite(d) || std::trunc(d) != d) return false;
        // 2^63 is exactly representable; anything at or above it cannot match
        if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) return false;
        return static_cast<std::int64_t>(d) == i;
    }

    bool float_equals_unsigned(double d, std::uint64_t u) {
        if (!std::isfinite(d) || std::trunc(d) != d) return false;
        if (d < 0.0 || d >= 18446744073709551616.0) return false;
        return static_cast<std::uint64_t>(d) == u;
    }

    bool integer_equals_unsigned(std::int64_t i, std::uint64_t u) {
        return i >= 0 && static_cast<std::uint64_t>(i) == u;
    }
}

double Number::as_double() const noexcept {
    switch (kind_) {
        case Kind::Integer: return static_cast<double>(integer_);
        case Kind::Unsigned: return static_cast<double>(unsigned_);
        case Kind::Float: break;
    }
    return float_;
}

bool operator==(const Number& lhs, const Number& rhs) noexcept {
    using Kind = Number::Kind;
    switch (lhs.kind_) {
        case Kind::Integer:
            switch (rhs.kind_) {
                case Kind::Integer: return lhs.integer_ == rhs.integer_;
                case Kind::Unsigned: return integer_equals_unsigned(lhs.integer_, rhs.unsigned_);
                case Kind::Float: return float_equals_integer(rhs.float_, lhs.integer_);
            }
            break;
        case Kind::Unsigned:
            switch (rhs.kind_) {
                case Kind::Integer: return integer_equals_unsigned(rhs.integer_, lhs.unsigned_);
                case Kind::Unsigned: return lhs.unsigned_ == rhs.unsigned_;
                case Kind::Float: return float_equals_unsigned(rhs.float_, lhs.unsigned_);
            }
            break;
        case Kind::Float:
            switch (rhs.kind_) {
                case Kind::Integer: return float_equals_integer(lhs.float_, rhs.integer_);
                case Kind::Unsigned: return float_equals_unsigned(lhs.float_, rhs.unsigned_);
                case Kind::Float: return lhs.float_ == rhs.float_;
            }
            break;
    }
    return false;
}

Element Element::array(Array items) {
    for (const auto& item : items) {
        item.release_exclusive();
    }
    Element result;
    result.data_ = std::make_shared<Array>(std::move(items));
    return result;
}

Element Element::object(Object members) {
    for (const auto& member : members) {
        member.second.release_exclusive();
    }
    Element result;
    result.data_ = std::make_shared<Object>(std::move(members));
    return result;
}

Element Element::from_json(const Json& json) {
    switch (json.type()) {
        case Json::value_t::null:
            return Element(nullptr);

        case Json::value_t::boolean:
            return Element(json.get<bool>());

        case Json::value_t::number_integer:
            return Element(Number(json.get<std::int64_t>()));

        case Json::value_t::number_unsigned:
            return Element(Number(json.get<std::uint64_t>()));

        case Json::value_t::number_float:
            return Element(Number(json.get<double>()));

        case Json::value_t::string:
            return Element(json.get<std::string>());

        case Json::value_t::array: {
            Array items;
            items.reserve(json.size());
            for (const auto& item : json) {
                items.push_back(from_json(item));
            }
            return array(std::move(items));
        }

        case Json::value_t::object: {
            Object members;
            members.reserve(json.size());
            for (auto it = json.begin(); it != json.end(); ++it) {
                members.emplace(it.key(), from_json(it.value()));
            }
            return object(std::move(members));
        }

        default:
            throw InvalidObjectType(json.type_name());
    }
}

Json Element::to_json() const {
    switch (type()) {
        case Type::Null:
            return Json(nullptr);

        case Type::Boolean:
            return Json(as_bool());

        case Type::Number: {
            const Number& n = as_number();
            switch (n.kind()) {
                case Number::Kind::Integer: return Json(n.as_integer());
                case Number::Kind::Unsigned: return Json(n.as_unsigned());
                case Number::Kind::Float: return Json(n.as_double());
            }
            break;
        }

        case Type::String:
            return Json(as_string());

        case Type::Array: {
            Json result = Json::array();
            for (const auto& item : as_array()) {
                result.push_back(item.to_json());
            }
            return result;
        }

        case Type::Object: {
            Json result = Json::object();
            for (const auto& [key, member] : as_object()) {
                result[key] = member.to_json();
            }
            return result;
        }
    }
    return Json(nullptr);
}

std::size_t Element::size() const noexcept {
    if (is_array()) return as_array().size();
    if (is_object()) return as_object().size();
    return 0;
}

Element Element::to_exclusive() const {
    Element result;
    if (is_array()) {
        // The source node is shared, so its child handles already are
        result.data_ = std::make_shared<Array>(as_array());
        result.exclusive_ = true;
    } else if (is_object()) {
        result.data_ = std::make_shared<Object>(as_object());
        result.exclusive_ = true;
    } else {
        result = *this;
    }
    return result;
}

Element Element::deep_clone() const {
    if (is_array()) {
        Array items;
        items.reserve(as_array().size());
        for (const auto& item : as_array()) {
            items.push_back(item.deep_clone());
        }
        Element result;
        result.data_ = std::make_shared<Array>(std::move(items));
        result.exclusive_ = true;
        return result;
    }

    if (is_object()) {
        Object members;
        members.reserve(as_object().size());
        for (const auto& [key, member] : as_object()) {
            members.emplace(key, member.deep_clone());
        }
        Element result;
        result.data_ = std::make_shared<Object>(std::move(members));
        result.exclusive_ = true;
        return result;
    }

    return *this;
}

void Element::release_exclusive() const noexcept {
    if (!exclusive_) {
        return;
    }
    exclusive_ = false;
    if (const auto* items = std::get_if<ArrayPtr>(&data_)) {
        for (const auto& item : **items) {
            item.release_exclusive();
        }
    } else if (const auto* members = std::get_if<ObjectPtr>(&data_)) {
        for (const auto& member : **members) {
            member.second.release_exclusive();
        }
    }
}

Element::Array& Element::array_storage() {
    if (!exclusive_ || !is_array()) {
        throw std::logic_error("array_storage() requires an exclusive array");
    }
    return *std::get<ArrayPtr>(data_);
}

Element::Object& Element::object_storage() {
    if (!exclusive_ || !is_object()) {
        throw std::logic_error("object_storage() requires an exclusive object");
    }
    return *std::get<ObjectPtr>(data_);
}

bool operator==(const Element& lhs, const Element& rhs) {
    if (lhs.type() != rhs.type()) {
        return false;
    }

    switch (lhs.type()) {
        case Element::Type::Null:
            return true;

        case Element::Type::Boolean:
            return lhs.as_bool() == rhs.as_bool();

        case Element::Type::Number:
            return lhs.as_number() == rhs.as_number();

        case Element::Type::String:
            return lhs.as_string() == rhs.as_string();

        case Element::Type::Array: {
            const auto& a = lhs.as_array();
            const auto& b = rhs.as_array();
            if (&a == &b) return true;
            if (a.size() != b.size()) return false;
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (a[i] != b[i]) return false;
            }
            return true;
        }

        case Element::Type::Object: {
            const auto& a = lhs.as_object();
            const auto& b = rhs.as_object();
            if (&a == &b) return true;
            if (a.size() != b.size()) return false;
            // Keys are unique, so equal sizes plus every lhs key matching is enough
            for (const auto& [key, member] : a) {
                auto it = b.find(key);
                if (it == b.end() || it->second != member) return false;
            }
            return true;
        }
    }
    return false;
}

std::string type_name(const Element& element) {
    switch (element.type()) {
        case Element::Type::Null: return "null";
        case Element::Type::Boolean: return "boolean";
        case Element::Type::Number: return "number";
        case Element::Type::String: return "string";
        case Element::Type::Array: return "array";
        case Element::Type::Object: return "object";
    }
    return "unknown";
}

} // namespace jpatch
