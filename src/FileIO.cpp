/**
 * @file FileIO.cpp
 * @brief File loading and writing implementation
 *
 * JSON goes through nlohmann::json, TOML through toml++.
 */

#include "jpatch/FileIO.hpp"
#include "jpatch/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace jpatch {

// ============================================================================
// TOML conversion
// ============================================================================

namespace {

/**
 * @brief Convert a toml++ node to decoded JSON
 */
Json toml_node_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Json(node.as_string()->get());

        case toml::node_type::integer:
            return Json(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Json(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Json(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Json(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Json(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Json(ss.str());
        }

        case toml::node_type::array: {
            Json arr = Json::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_node_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Json obj = Json::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_node_to_json(val);
            }
            return obj;
        }

        default:
            return Json(nullptr);
    }
}

toml::array make_toml_array(const Element& element, const std::string& path);
toml::table make_toml_table(const Element& element, const std::string& path);

/**
 * @brief Add one element to a TOML array or table via @p sink
 */
template <typename Sink>
void emit_toml_value(const Element& element, const std::string& path, Sink&& sink) {
    switch (element.type()) {
        case Element::Type::Object:
            sink(make_toml_table(element, path));
            return;

        case Element::Type::Array:
            sink(make_toml_array(element, path));
            return;

        case Element::Type::String:
            sink(element.as_string());
            return;

        case Element::Type::Boolean:
            sink(element.as_bool());
            return;

        case Element::Type::Number: {
            const Number& n = element.as_number();
            if (n.kind() == Number::Kind::Integer) {
                sink(n.as_integer());
            } else if (n.kind() == Number::Kind::Unsigned &&
                       n.as_unsigned() <= static_cast<std::uint64_t>(
                           std::numeric_limits<std::int64_t>::max())) {
                sink(static_cast<std::int64_t>(n.as_unsigned()));
            } else {
                // Oversize for TOML int; fall back to double
                sink(n.as_double());
            }
            return;
        }

        case Element::Type::Null:
            break;
    }
    throw UnsupportedFormatError("TOML cannot represent null at '" + path + "'");
}

toml::array make_toml_array(const Element& element, const std::string& path) {
    toml::array out;
    const auto& items = element.as_array();
    for (std::size_t i = 0; i < items.size(); ++i) {
        emit_toml_value(items[i], path + "/" + std::to_string(i),
                        [&out](auto&& value) { out.push_back(std::forward<decltype(value)>(value)); });
    }
    return out;
}

toml::table make_toml_table(const Element& element, const std::string& path) {
    toml::table tbl;
    for (const auto& [key, member] : element.as_object()) {
        emit_toml_value(member, path + "/" + Pointer::escape(key),
                        [&tbl, &key](auto&& value) { tbl.insert(key, std::forward<decltype(value)>(value)); });
    }
    return tbl;
}

} // anonymous namespace

// ============================================================================
// Files
// ============================================================================

std::string file_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string read_text_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec) || !fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

Element load_document(const std::string& path) {
    const std::string ext = file_extension(path);

    if (ext == ".json") {
        return parse_document(read_text_file(path), path);
    }

    if (ext == ".toml") {
        const std::string content = read_text_file(path);
        toml::table table;
        try {
            table = toml::parse(content, path);
        } catch (const toml::parse_error& e) {
            std::ostringstream details;
            details << e.description() << " (line " << e.source().begin.line
                    << ", column " << e.source().begin.column << ")";
            throw DocumentParseError(path, details.str());
        }
        return Element::from_json(toml_node_to_json(table));
    }

    throw UnsupportedFormatError("'" + ext + "' documents (expected .json or .toml)");
}

Patch load_patch(const std::string& path) {
    const std::string content = read_text_file(path);
    Json json;
    try {
        json = Json::parse(content);
    } catch (const Json::parse_error& e) {
        throw DocumentParseError(path, e.what());
    }
    return Patch::from_json(json);
}

std::string to_toml_string(const Element& document) {
    if (!document.is_object()) {
        throw UnsupportedFormatError("TOML documents must have a table at the root, got " +
                                     type_name(document));
    }
    std::ostringstream oss;
    oss << make_toml_table(document, "");
    return oss.str();
}

void write_document(const std::string& path, const Element& document,
                    const SerializeOptions& options) {
    const std::string ext = file_extension(path);

    std::string text;
    if (ext == ".json") {
        text = serialize(document, options) + "\n";
    } else if (ext == ".toml") {
        text = to_toml_string(document);
    } else {
        throw UnsupportedFormatError("'" + ext + "' output (expected .json or .toml)");
    }

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) {
        throw PatchError("Failed to open for write: " + path);
    }
    ofs << text;
}

} // namespace jpatch
