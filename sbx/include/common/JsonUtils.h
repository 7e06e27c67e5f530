#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace SBX {

using json = nlohmann::json;

/**
 * @brief Shared nlohmann/json helpers
 *
 * Parsing never throws; lookups fall back to defaults when a key is absent or has the
 * wrong type. Used by configuration loading, size accounting and the CLI runner.
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON text
     * @param jsonString Input JSON string
     * @param errorOut Optional error message output
     * @return Parsed value or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    static std::string toCompactString(const json &value);

    static std::string toPrettyString(const json &value);

    /**
     * @brief Byte length of the compact serialization
     *
     * Invalid UTF-8 inside strings is replaced rather than rejected so the size of
     * any host value can be measured.
     */
    static size_t serializedSize(const json &value);

    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");

    static int64_t getInt64(const json &object, const std::string &key, int64_t defaultValue = 0);

    static bool getBool(const json &object, const std::string &key, bool defaultValue = false);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const json &object, const std::string &key);
};

}  // namespace SBX
