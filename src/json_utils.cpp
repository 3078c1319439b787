#include "json_utils.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <memory>

Json::Value parse_json(const std::string& text, const std::string& source) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw PkgcdnException(string_format("error.json_parse_failed", source, errors));
    }
    return root;
}

std::string to_json_string(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}
