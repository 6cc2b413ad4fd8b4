/**
 * @file Serialize.cpp
 * @brief Implementation of JSON encoding and decoding
 */

#include "jpatch/Serialize.hpp"
#include "jpatch/Errors.hpp"

namespace jpatch {

std::string serialize(const Element& element, const SerializeOptions& options) {
    if (element.is_container()) {
        return element.to_json().dump(options.indent);
    }

    // Formatting options are not applied here so that the wrapper's
    // brackets are always the first and last bytes
    Json wrapper = Json::array();
    wrapper.push_back(element.to_json());
    const std::string text = wrapper.dump();

    const auto close = text.rfind(']');
    if (text.empty() || text.front() != '[' || close == std::string::npos || close == 0) {
        throw InvalidObjectType(type_name(element));
    }
    return text.substr(1, close - 1);
}

Element parse_document(const std::string& text, const std::string& source) {
    Json json;
    try {
        json = Json::parse(text);
    } catch (const Json::parse_error& e) {
        throw DocumentParseError(source, e.what());
    }
    return Element::from_json(json);
}

std::ostream& operator<<(std::ostream& os, const Element& element) {
    return os << serialize(element);
}

} // namespace jpatch
