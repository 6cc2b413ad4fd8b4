/**
 * @file FileIO.hpp
 * @brief Reading and writing documents and patches on disk
 *
 * Supported formats, chosen by file extension:
 * - .json: any JSON value (using nlohmann::json)
 * - .toml: a table at the root (using toml++); dates and times are read
 *   as strings, and null cannot be written
 *
 * Patches are always JSON.
 */

#ifndef JPATCH_FILEIO_HPP
#define JPATCH_FILEIO_HPP

#include "jpatch/Element.hpp"
#include "jpatch/Patch.hpp"
#include "jpatch/Serialize.hpp"
#include <string>

namespace jpatch {

/**
 * @brief Lowercased extension including the dot (".json"), or ""
 */
std::string file_extension(const std::string& path);

/**
 * @brief Read a whole file
 * @throws FileNotFoundError if the file does not exist or cannot be opened
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Load a document, auto-detecting the format by extension
 *
 * @param path Path to a .json or .toml file
 * @return Decoded document
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if the file has a syntax error
 * @throws UnsupportedFormatError for any other extension
 */
Element load_document(const std::string& path);

/**
 * @brief Load a JSON patch file
 * @throws FileNotFoundError, DocumentParseError, or any Patch::from_json error
 */
Patch load_patch(const std::string& path);

/**
 * @brief Encode a document as a TOML table
 * @throws UnsupportedFormatError if the root is not an object or the
 *         document contains null
 */
std::string to_toml_string(const Element& document);

/**
 * @brief Write a document, choosing the format by extension
 *
 * @param path Destination (.json or .toml)
 * @param document Tree to write
 * @param options JSON formatting; ignored for TOML
 * @throws UnsupportedFormatError for unknown extensions or documents TOML
 *         cannot hold
 * @throws PatchError if the file cannot be opened for writing
 */
void write_document(const std::string& path, const Element& document,
                    const SerializeOptions& options = {2});

} // namespace jpatch

#endif // JPATCH_FILEIO_HPP
