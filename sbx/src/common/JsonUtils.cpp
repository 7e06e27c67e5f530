#include "common/JsonUtils.h"
#include "common/Logger.h"

namespace SBX {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        if (errorOut) {
            *errorOut = e.what();
        }
        LOG_DEBUG("JsonUtils: Failed to parse JSON: {}", e.what());
        return std::nullopt;
    }
}

std::string JsonUtils::toCompactString(const json &value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string JsonUtils::toPrettyString(const json &value) {
    return value.dump(2, ' ', false, json::error_handler_t::replace);
}

size_t JsonUtils::serializedSize(const json &value) {
    return toCompactString(value).size();
}

std::string JsonUtils::getString(const json &object, const std::string &key, const std::string &defaultValue) {
    if (!object.is_object()) {
        return defaultValue;
    }

    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return defaultValue;
    }
    return it->get<std::string>();
}

int64_t JsonUtils::getInt64(const json &object, const std::string &key, int64_t defaultValue) {
    if (!object.is_object()) {
        return defaultValue;
    }

    auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer()) {
        return defaultValue;
    }
    return it->get<int64_t>();
}

bool JsonUtils::getBool(const json &object, const std::string &key, bool defaultValue) {
    if (!object.is_object()) {
        return defaultValue;
    }

    auto it = object.find(key);
    if (it == object.end() || !it->is_boolean()) {
        return defaultValue;
    }
    return it->get<bool>();
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    if (!object.is_object()) {
        return false;
    }
    auto it = object.find(key);
    return it != object.end() && !it->is_null();
}

}  // namespace SBX
