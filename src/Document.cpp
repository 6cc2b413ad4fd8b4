/**
 * @file Document.cpp
 * @brief Implementation of the patch engine
 */

#include "jpatch/Document.hpp"
#include "jpatch/Errors.hpp"
#include <cstddef>
#include <stdexcept>

namespace jpatch {

namespace {
    /**
     * @brief Parse an array index token
     * @return The index, or nullopt if the token is not a valid index
     */
    std::optional<std::size_t> array_index(const std::string& token) {
        if (!Pointer::is_valid_array_index(token)) {
            return std::nullopt;
        }
        try {
            return static_cast<std::size_t>(std::stoull(token));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    /**
     * @brief Evaluate one reference token against a container
     * @throws ReferencesNonexistentValue if the token does not resolve
     */
    const Element& child_of(const Element& parent, const Pointer& path,
                            const std::string& token) {
        if (parent.is_object()) {
            const auto& members = parent.as_object();
            auto it = members.find(token);
            if (it == members.end()) {
                throw ReferencesNonexistentValue(path.str(), token);
            }
            return it->second;
        }

        if (parent.is_array()) {
            const auto& items = parent.as_array();
            if (token == "-") {
                // "-" reads the last element
                if (items.empty()) {
                    throw ReferencesNonexistentValue(path.str(), token);
                }
                return items.back();
            }
            auto index = array_index(token);
            if (!index || *index >= items.size()) {
                throw ReferencesNonexistentValue(path.str(), token);
            }
            return items[*index];
        }

        // Scalars have no children
        throw ReferencesNonexistentValue(path.str(), token);
    }

    const Element& value_of(const Operation& operation) {
        if (!operation.value) {
            throw InvalidPatchFormat(std::string("'") + to_string(operation.type) +
                                     "' operation has no value");
        }
        return *operation.value;
    }

    const Pointer& from_of(const Operation& operation) {
        if (!operation.from) {
            throw InvalidPatchFormat(std::string("'") + to_string(operation.type) +
                                     "' operation has no source pointer");
        }
        return *operation.from;
    }
}

Document::Document(Element root)
    : root_(std::move(root))
{}

Element Document::release() && {
    return std::move(root_);
}

const Element& Document::resolve(const Pointer& pointer) const {
    const Element* current = &root_;
    for (const auto& token : pointer.tokens()) {
        current = &child_of(*current, pointer, token);
    }
    return *current;
}

Element& Document::child_slot(Element& container, const Pointer& path,
                              const std::string& token) {
    if (container.is_object()) {
        auto& members = container.object_storage();
        auto it = members.find(token);
        if (it == members.end()) {
            throw ReferencesNonexistentValue(path.str(), token);
        }
        return it->second;
    }

    auto& items = container.array_storage();
    if (token == "-") {
        if (items.empty()) {
            throw ReferencesNonexistentValue(path.str(), token);
        }
        return items.back();
    }
    auto index = array_index(token);
    if (!index || *index >= items.size()) {
        throw ReferencesNonexistentValue(path.str(), token);
    }
    return items[*index];
}

Element& Document::make_exclusive_path(const Pointer& target) {
    const auto& tokens = target.tokens();
    if (tokens.empty()) {
        throw std::logic_error("make_exclusive_path() requires a non-root pointer");
    }

    if (!root_.is_mutable()) {
        if (!root_.is_container()) {
            throw ReferencesNonexistentValue(target.str(), tokens.front());
        }
        root_ = root_.to_exclusive();
    }

    Element* current = &root_;
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        Element& child = child_slot(*current, target, tokens[i]);
        if (!child.is_mutable()) {
            if (!child.is_container()) {
                // The next token would have to be looked up inside a scalar
                throw ReferencesNonexistentValue(target.str(), tokens[i + 1]);
            }
            child = child.to_exclusive();
        }
        current = &child;
    }

    return *current;
}

void Document::add(const Pointer& path, Element value) {
    if (path.is_root()) {
        root_ = std::move(value);
        return;
    }

    Element& parent = make_exclusive_path(path);
    const std::string& token = path.back();

    if (parent.is_object()) {
        parent.object_storage()[token] = std::move(value);
        return;
    }

    auto& items = parent.array_storage();
    if (token == "-") {
        items.push_back(std::move(value));
        return;
    }

    // Inserting at size() is an append; anything past it is an error
    auto index = array_index(token);
    if (!index || *index > items.size()) {
        throw ReferencesNonexistentValue(path.str(), token);
    }
    items.insert(items.begin() + static_cast<std::ptrdiff_t>(*index), std::move(value));
}

void Document::remove(const Pointer& path) {
    if (path.is_root()) {
        root_ = Element(nullptr);
        return;
    }

    Element& parent = make_exclusive_path(path);
    const std::string& token = path.back();

    if (parent.is_object()) {
        if (parent.object_storage().erase(token) == 0) {
            throw ReferencesNonexistentValue(path.str(), token);
        }
        return;
    }

    auto& items = parent.array_storage();
    if (token == "-") {
        if (items.empty()) {
            throw ReferencesNonexistentValue(path.str(), token);
        }
        items.pop_back();
        return;
    }

    auto index = array_index(token);
    if (!index || *index >= items.size()) {
        throw ReferencesNonexistentValue(path.str(), token);
    }
    items.erase(items.begin() + static_cast<std::ptrdiff_t>(*index));
}

void Document::replace(const Pointer& path, Element value) {
    if (path.is_root()) {
        root_ = std::move(value);
        return;
    }

    Element& parent = make_exclusive_path(path);
    Element& slot = child_slot(parent, path, path.back());
    slot = std::move(value);
}

void Document::move(const Pointer& from, const Pointer& path) {
    if (path.is_root()) {
        Element value = resolve(from);
        root_ = std::move(value);
        return;
    }

    if (from.is_root()) {
        throw ReferencesNonexistentValue(from.str(), "");
    }

    if (from == path) {
        // Nothing moves, but the source must still exist
        resolve(from);
        return;
    }

    if (from.is_prefix_of(path)) {
        throw InvalidMoveTarget(from.str(), path.str());
    }

    // Copying the root demotes the working spine, so the checkpoint is
    // never written and can be restored if the add half fails
    Element checkpoint = root_;
    try {
        Element& source_parent = make_exclusive_path(from);
        Element value = std::move(child_slot(source_parent, from, from.back()));
        remove(from);
        add(path, std::move(value));
    } catch (const PatchError&) {
        root_ = std::move(checkpoint);
        throw;
    }
}

void Document::copy(const Pointer& from, const Pointer& path) {
    if (path.is_root()) {
        root_ = resolve(from).deep_clone();
        return;
    }

    if (from.is_root()) {
        throw ReferencesNonexistentValue(from.str(), "");
    }

    add(path, resolve(from).deep_clone());
}

void Document::test(const Pointer& path, const Element& expected) const {
    const Element* found = nullptr;
    try {
        found = &resolve(path);
    } catch (const ReferencesNonexistentValue&) {
        throw PatchTestFailed(path.str(), expected.to_json(), std::nullopt);
    }

    if (*found != expected) {
        throw PatchTestFailed(path.str(), expected.to_json(), found->to_json());
    }
}

void Document::apply(const Operation& operation) {
    switch (operation.type) {
        case OperationType::Add:
            add(operation.path, value_of(operation));
            break;
        case OperationType::Remove:
            remove(operation.path);
            break;
        case OperationType::Replace:
            replace(operation.path, value_of(operation));
            break;
        case OperationType::Move:
            move(from_of(operation), operation.path);
            break;
        case OperationType::Copy:
            copy(from_of(operation), operation.path);
            break;
        case OperationType::Test:
            test(operation.path, value_of(operation));
            break;
    }
}

} // namespace jpatch
