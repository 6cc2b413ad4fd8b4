/**
 * @file Operation.cpp
 * @brief Implementation of patch operation decoding
 */

#include "jpatch/Operation.hpp"
#include "jpatch/Errors.hpp"

namespace jpatch {

namespace {
    /**
     * @brief Read a member that must be a JSON Pointer string
     */
    std::optional<Pointer> pointer_member(const Json& json, const char* name,
                                          const std::string& op, std::size_t index) {
        auto it = json.find(name);
        if (it == json.end()) {
            return std::nullopt;
        }
        if (!it->is_string()) {
            throw InvalidPatchFormat("member '" + std::string(name) + "' of '" + op +
                                     "' operation at index " + std::to_string(index) +
                                     " must be a string");
        }
        return Pointer::parse(it->get<std::string>());
    }

    Pointer require_pointer(const Json& json, const char* name,
                            const std::string& op, std::size_t index) {
        auto pointer = pointer_member(json, name, op, index);
        if (!pointer) {
            throw MissingRequiredPatchField(op, index, name);
        }
        return std::move(*pointer);
    }

    Element require_value(const Json& json, const std::string& op, std::size_t index) {
        auto it = json.find("value");
        if (it == json.end()) {
            throw MissingRequiredPatchField(op, index, "value");
        }
        return Element::from_json(*it);
    }
}

const char* to_string(OperationType type) noexcept {
    switch (type) {
        case OperationType::Add: return "add";
        case OperationType::Remove: return "remove";
        case OperationType::Replace: return "replace";
        case OperationType::Move: return "move";
        case OperationType::Copy: return "copy";
        case OperationType::Test: return "test";
    }
    return "unknown";
}

std::optional<OperationType> operation_type_from_string(const std::string& name) {
    if (name == "add") return OperationType::Add;
    if (name == "remove") return OperationType::Remove;
    if (name == "replace") return OperationType::Replace;
    if (name == "move") return OperationType::Move;
    if (name == "copy") return OperationType::Copy;
    if (name == "test") return OperationType::Test;
    return std::nullopt;
}

Operation Operation::add(Pointer path, Element value) {
    Operation op;
    op.type = OperationType::Add;
    op.path = std::move(path);
    op.value = std::move(value);
    return op;
}

Operation Operation::remove(Pointer path) {
    Operation op;
    op.type = OperationType::Remove;
    op.path = std::move(path);
    return op;
}

Operation Operation::replace(Pointer path, Element value) {
    Operation op;
    op.type = OperationType::Replace;
    op.path = std::move(path);
    op.value = std::move(value);
    return op;
}

Operation Operation::move(Pointer from, Pointer path) {
    Operation op;
    op.type = OperationType::Move;
    op.from = std::move(from);
    op.path = std::move(path);
    return op;
}

Operation Operation::copy(Pointer from, Pointer path) {
    Operation op;
    op.type = OperationType::Copy;
    op.from = std::move(from);
    op.path = std::move(path);
    return op;
}

Operation Operation::test(Pointer path, Element value) {
    Operation op;
    op.type = OperationType::Test;
    op.path = std::move(path);
    op.value = std::move(value);
    return op;
}

Operation Operation::from_json(const Json& json, std::size_t index) {
    if (!json.is_object()) {
        throw InvalidPatchFormat("operation at index " + std::to_string(index) +
                                 " is not an object");
    }

    auto op_it = json.find("op");
    if (op_it == json.end()) {
        throw MissingRequiredPatchField("", index, "op");
    }
    if (!op_it->is_string()) {
        throw InvalidPatchFormat("member 'op' at index " + std::to_string(index) +
                                 " must be a string");
    }

    const std::string name = op_it->get<std::string>();
    auto type = operation_type_from_string(name);
    if (!type) {
        throw UnknownPatchOperation(name, index);
    }

    // Members not used by an operation are ignored, as RFC 6902 requires
    Pointer path = require_pointer(json, "path", name, index);
    switch (*type) {
        case OperationType::Add:
            return add(std::move(path), require_value(json, name, index));
        case OperationType::Remove:
            return remove(std::move(path));
        case OperationType::Replace:
            return replace(std::move(path), require_value(json, name, index));
        case OperationType::Move:
            return move(require_pointer(json, "from", name, index), std::move(path));
        case OperationType::Copy:
            return copy(require_pointer(json, "from", name, index), std::move(path));
        case OperationType::Test:
            return test(std::move(path), require_value(json, name, index));
    }
    throw UnknownPatchOperation(name, index);
}

Json Operation::to_json() const {
    Json json = Json::object();
    json["op"] = to_string(type);
    if (from) {
        json["from"] = from->str();
    }
    json["path"] = path.str();
    if (value) {
        json["value"] = value->to_json();
    }
    return json;
}

Operation Operation::relative_to(const Pointer& base) const {
    Operation op = *this;
    op.path = base.concat(path);
    if (from) {
        op.from = base.concat(*from);
    }
    return op;
}

bool operator==(const Operation& lhs, const Operation& rhs) {
    return lhs.type == rhs.type && lhs.path == rhs.path &&
           lhs.from == rhs.from && lhs.value == rhs.value;
}

} // namespace jpatch
