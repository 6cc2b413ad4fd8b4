/**
 * @file Serialize.hpp
 * @brief Conversion between Element trees and JSON text
 *
 * Containers are handed to nlohmann/json directly. A scalar root (a legal
 * patch result, e.g. after replacing "") is encoded as a fragment: it is
 * wrapped in a one-element array, the array is encoded compactly, and the
 * surrounding '[' and ']' are sliced off.
 */

#ifndef JPATCH_SERIALIZE_HPP
#define JPATCH_SERIALIZE_HPP

#include "jpatch/Element.hpp"
#include <ostream>
#include <string>

namespace jpatch {

/**
 * @brief Output formatting options
 */
struct SerializeOptions {
    // Spaces per level; -1 for compact output. Ignored for scalar roots.
    int indent = -1;
};

/**
 * @brief Encode an Element as JSON text
 *
 * Examples:
 * ```cpp
 * serialize(Element::from_json(Json::parse(R"({"a":1})")));  // {"a":1}
 * serialize(Element("x"));                                  // "x"
 * serialize(Element(nullptr), {2});                          // null
 * ```
 */
std::string serialize(const Element& element, const SerializeOptions& options = {});

/**
 * @brief Decode JSON text, scalars included, into an Element
 *
 * @param text JSON text
 * @param source Name used in error messages
 * @throws DocumentParseError if the text is not valid JSON
 */
Element parse_document(const std::string& text, const std::string& source = "<string>");

/**
 * @brief Write the compact encoding of @p element
 */
std::ostream& operator<<(std::ostream& os, const Element& element);

} // namespace jpatch

#endif // JPATCH_SERIALIZE_HPP
