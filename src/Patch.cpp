/**
 * @file Patch.cpp
 * @brief Implementation of patch decoding and application
 */

#include "jpatch/Patch.hpp"
#include "jpatch/Document.hpp"
#include "jpatch/Errors.hpp"

namespace jpatch {

namespace {
    Operation prepare(const Operation& operation, const ApplyOptions& options) {
        if (options.relative_to) {
            return operation.relative_to(*options.relative_to);
        }
        return operation;
    }
}

Patch Patch::from_json(const Json& json) {
    if (!json.is_array()) {
        throw InvalidPatchFormat("patch document must be an array, got " +
                                 std::string(json.type_name()));
    }

    std::vector<Operation> operations;
    operations.reserve(json.size());
    for (std::size_t i = 0; i < json.size(); ++i) {
        operations.push_back(Operation::from_json(json[i], i));
    }
    return Patch(std::move(operations));
}

Patch Patch::parse(const std::string& text) {
    Json json;
    try {
        json = Json::parse(text);
    } catch (const Json::parse_error& e) {
        throw DocumentParseError("<patch>", e.what());
    }
    return from_json(json);
}

Json Patch::to_json() const {
    Json json = Json::array();
    for (const auto& operation : operations_) {
        json.push_back(operation.to_json());
    }
    return json;
}

Element Patch::apply(const Element& document, const ApplyOptions& options) const {
    // The working copy starts shared; the first write promotes the root, so
    // a failure anywhere leaves the caller's tree as it was
    Document working(document);

    for (std::size_t i = 0; i < operations_.size(); ++i) {
        const Operation operation = prepare(operations_[i], options);
        try {
            working.apply(operation);
        } catch (PatchError& e) {
            e.set_operation_index(i);
            throw;
        }
        if (options.on_applied) options.on_applied(i, operation);
    }

    return std::move(working).release();
}

void Patch::apply_in_place(Element& document, const ApplyOptions& options) const {
    for (std::size_t i = 0; i < operations_.size(); ++i) {
        const Operation operation = prepare(operations_[i], options);
        Document step(document);
        try {
            step.apply(operation);
        } catch (PatchError& e) {
            e.set_operation_index(i);
            throw;
        }
        document = std::move(step).release();
        if (options.on_applied) options.on_applied(i, operation);
    }
}

Json apply_patch(const Json& document, const Json& patch, const ApplyOptions& options) {
    const Patch decoded = Patch::from_json(patch);
    return decoded.apply(Element::from_json(document), options).to_json();
}

} // namespace jpatch
