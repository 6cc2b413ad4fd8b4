/**
 * @file Document.hpp
 * @brief Patch engine: pointer resolution and copy-on-write mutation
 *
 * A Document owns the root handle of one JSON tree and applies patch
 * operations to it. Nodes reachable from handles held elsewhere are never
 * written: before each write the engine promotes the containers on the path
 * from the root to the target (make_exclusive_path), copying one level per
 * token, and rebinds each parent slot to the promoted child. Untouched
 * branches stay shared with every earlier snapshot.
 *
 * Examples:
 * ```cpp
 * Element before = Element::from_json(Json::parse(R"({"a": {"b": 1}})"));
 * Document doc(before);
 * doc.add(Pointer::parse("/a/c"), 2);
 * // doc.root() == {"a": {"b": 1, "c": 2}}, before is still {"a": {"b": 1}}
 * ```
 */

#ifndef JPATCH_DOCUMENT_HPP
#define JPATCH_DOCUMENT_HPP

#include "jpatch/Element.hpp"
#include "jpatch/Operation.hpp"
#include "jpatch/Pointer.hpp"
#include <string>

namespace jpatch {

class Document {
public:
    Document() = default;

    /**
     * @brief Take a tree to patch
     *
     * Passing an lvalue copies the handle, which leaves both copies shared:
     * the first write then promotes the root instead of writing in place.
     */
    explicit Document(Element root);

    /**
     * @brief Current tree
     *
     * Copying the result demotes the engine's handles below it, so later
     * writes never reach the copy.
     */
    const Element& root() const noexcept { return root_; }

    /**
     * @brief Hand the patched tree back to the caller
     */
    Element release() &&;

    /**
     * @brief Evaluate a pointer against the document
     *
     * @return The referenced element
     * @throws ReferencesNonexistentValue if any token does not resolve.
     *         In arrays "-" reads the last element.
     */
    const Element& resolve(const Pointer& pointer) const;

    /**
     * @brief Insert @p value at @p path
     *
     * - root: the document becomes @p value
     * - object parent: key inserted or overwritten
     * - array parent: "-" appends, an index in [0, size] inserts
     *
     * @throws ReferencesNonexistentValue if the parent does not exist, is
     *         not a container, or the index is invalid or out of range
     */
    void add(const Pointer& path, Element value);

    /**
     * @brief Remove the value at @p path
     *
     * Removing the root leaves a Null document.
     * @throws ReferencesNonexistentValue if there is nothing to remove
     */
    void remove(const Pointer& path);

    /**
     * @brief Overwrite the existing value at @p path
     * @throws ReferencesNonexistentValue if there is no value to replace
     */
    void replace(const Pointer& path, Element value);

    /**
     * @brief Remove the value at @p from and add it at @p path
     *
     * @throws ReferencesNonexistentValue if @p from is the root or does not
     *         resolve, or @p path cannot be added to
     * @throws InvalidMoveTarget if @p path lies inside @p from
     */
    void move(const Pointer& from, const Pointer& path);

    /**
     * @brief Add a deep clone of the value at @p from at @p path
     *
     * @throws ReferencesNonexistentValue if @p from is the root or does not
     *         resolve, or @p path cannot be added to
     */
    void copy(const Pointer& from, const Pointer& path);

    /**
     * @brief Compare the value at @p path with @p expected
     * @throws PatchTestFailed if the path does not resolve or the values
     *         are not structurally equal
     */
    void test(const Pointer& path, const Element& expected) const;

    /**
     * @brief Dispatch one operation
     */
    void apply(const Operation& operation);

private:
    /**
     * @brief Promote every container from the root down to the parent of
     *        @p target
     *
     * Each step copies one level (Element::to_exclusive) unless the handle
     * is already exclusive, and rebinds the parent slot to the copy.
     *
     * @param target Non-root pointer about to be written
     * @return The exclusive container holding the last token of @p target
     * @throws ReferencesNonexistentValue if a token does not resolve or the
     *         parent of @p target is not a container
     */
    Element& make_exclusive_path(const Pointer& target);

    // Writable slot for an existing child of an exclusive container.
    static Element& child_slot(Element& container, const Pointer& path,
                               const std::string& token);

    Element root_;
};

} // namespace jpatch

#endif // JPATCH_DOCUMENT_HPP
