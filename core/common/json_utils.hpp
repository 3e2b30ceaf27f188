#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace attrtools {

/// Parse a JSON document handed over as text. Syntax errors are
/// rethrown as `Error` (an AttributionError subclass) naming `what`.
template <typename Error>
nlohmann::json parseJsonAs(const std::string& text, const char* what) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw Error(std::string(what) + " is not valid JSON: " + e.what());
    }
}

} // namespace attrtools
