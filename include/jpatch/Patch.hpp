/**
 * @file Patch.hpp
 * @brief RFC 6902 JSON Patch documents
 *
 * A Patch is an ordered list of operations. Operations run strictly in
 * order against the evolving document.
 *
 * Atomicity:
 * - apply() is all-or-nothing: the input is never modified and a patched
 *   copy is returned only if every operation succeeds.
 * - apply_in_place() keeps every operation that succeeded before the
 *   failing one; each single operation is still all-or-nothing.
 *
 * Either way the error raised carries the index of the failing operation
 * (PatchError::operation_index()).
 */

#ifndef JPATCH_PATCH_HPP
#define JPATCH_PATCH_HPP

#include "jpatch/Element.hpp"
#include "jpatch/Operation.hpp"
#include "jpatch/Pointer.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace jpatch {

/**
 * @brief Options for applying a patch
 */
struct ApplyOptions {
    // Prefix for every "path" and "from", e.g. "/config" to patch a subtree
    std::optional<Pointer> relative_to;

    // Called after each operation that succeeds, with its index and the
    // operation as applied (relative_to already resolved)
    std::function<void(std::size_t, const Operation&)> on_applied;
};

class Patch {
public:
    Patch() = default;
    explicit Patch(std::vector<Operation> operations)
        : operations_(std::move(operations)) {}

    /**
     * @brief Decode a patch document
     *
     * @param json Array of operation objects
     * @return Decoded patch
     * @throws InvalidPatchFormat if json is not an array of objects
     * @throws UnknownPatchOperation, MissingRequiredPatchField,
     *         InvalidPointerSyntax, InvalidObjectType for bad operations
     *
     * Examples:
     * ```cpp
     * auto patch = Patch::from_json(Json::parse(
     *     R"([{"op": "add", "path": "/b", "value": 2}])"));
     * patch.size();  // 1
     * ```
     */
    static Patch from_json(const Json& json);

    /**
     * @brief Decode a patch from JSON text
     * @throws DocumentParseError if the text is not valid JSON
     */
    static Patch parse(const std::string& text);

    Json to_json() const;

    const std::vector<Operation>& operations() const noexcept { return operations_; }
    std::size_t size() const noexcept { return operations_.size(); }
    bool empty() const noexcept { return operations_.empty(); }

    /**
     * @brief Apply every operation to a copy of @p document
     *
     * @param document Tree to patch; left untouched
     * @param options Apply options
     * @return The patched tree
     * @throws PatchError subclass of the first failing operation, tagged
     *         with its index
     */
    Element apply(const Element& document, const ApplyOptions& options = {}) const;

    /**
     * @brief Apply operations one by one, keeping each that succeeds
     *
     * On failure @p document holds the result of the operations before the
     * failing one and the error is rethrown.
     */
    void apply_in_place(Element& document, const ApplyOptions& options = {}) const;

private:
    std::vector<Operation> operations_;
};

/**
 * @brief Decode, patch and re-encode in one step
 *
 * @param document Decoded target document
 * @param patch Decoded patch document
 * @return Patched document
 */
Json apply_patch(const Json& document, const Json& patch, const ApplyOptions& options = {});

} // namespace jpatch

#endif // JPATCH_PATCH_HPP
