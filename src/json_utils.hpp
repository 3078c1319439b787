#pragma once

#include <json/json.h>

#include <string>

// Parses a JSON document; `source` names it in the error message. Throws
// PkgcdnException on malformed input.
Json::Value parse_json(const std::string& text, const std::string& source);

// Compact serialization used for HTTP bodies.
std::string to_json_string(const Json::Value& value);
