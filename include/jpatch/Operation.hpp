/**
 * @file Operation.hpp
 * @brief RFC 6902 patch operations
 *
 * Six variants:
 * - add     {path, value}
 * - remove  {path}
 * - replace {path, value}
 * - move    {from, path}
 * - copy    {from, path}
 * - test    {path, value}
 */

#ifndef JPATCH_OPERATION_HPP
#define JPATCH_OPERATION_HPP

#include "jpatch/Element.hpp"
#include "jpatch/Pointer.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace jpatch {

enum class OperationType { Add, Remove, Replace, Move, Copy, Test };

/**
 * @brief Name used for the "op" member ("add", "remove", ...)
 */
const char* to_string(OperationType type) noexcept;

/**
 * @brief Look up an operation by its "op" name
 * @return The type, or nullopt for unknown names (case-sensitive)
 */
std::optional<OperationType> operation_type_from_string(const std::string& name);

/**
 * @brief One patch operation
 *
 * Build with the named factories; they guarantee that `from` is set exactly
 * for move/copy and `value` exactly for add/replace/test.
 */
struct Operation {
    OperationType type = OperationType::Test;
    Pointer path;
    std::optional<Pointer> from;
    std::optional<Element> value;

    static Operation add(Pointer path, Element value);
    static Operation remove(Pointer path);
    static Operation replace(Pointer path, Element value);
    static Operation move(Pointer from, Pointer path);
    static Operation copy(Pointer from, Pointer path);
    static Operation test(Pointer path, Element value);

    /**
     * @brief Decode one operation object of a patch document
     *
     * @param json Operation object, e.g. {"op": "add", "path": "/a", "value": 1}
     * @param index Position in the patch, used in error messages
     * @throws InvalidPatchFormat if json is not an object or a member has the
     *         wrong type
     * @throws UnknownPatchOperation if "op" is not one of the six names
     * @throws MissingRequiredPatchField if "path", "from" or "value" is absent
     * @throws InvalidPointerSyntax if "path" or "from" is malformed
     * @throws InvalidObjectType if "value" cannot be represented
     */
    static Operation from_json(const Json& json, std::size_t index);

    /**
     * @brief Encode as an operation object
     */
    Json to_json() const;

    /**
     * @brief Copy of this operation with path/from prefixed by @p base
     */
    Operation relative_to(const Pointer& base) const;
};

bool operator==(const Operation& lhs, const Operation& rhs);
inline bool operator!=(const Operation& lhs, const Operation& rhs) {
    return !(lhs == rhs);
}

} // namespace jpatch

#endif // JPATCH_OPERATION_HPP
