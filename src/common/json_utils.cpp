#include "json_utils.h"
#include "structured_logger.h"
#include "string_utils.h"

namespace stepcoach {
namespace utils {

std::string JsonUtils::getStringField(const nlohmann::json& json, const std::string& fieldName,
                                      const std::string& defaultValue) {
    if (!json.is_object() || !json.contains(fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_string()) {
        return field.get<std::string>();
    } else if (field.is_number_integer()) {
        return std::to_string(field.get<long long>());
    } else if (field.is_number()) {
        return std::to_string(field.get<double>());
    } else if (field.is_boolean()) {
        return field.get<bool>() ? "true" : "false";
    } else if (!field.is_null()) {
        SLOG_DEBUG().message("Field is not a string, returning default value").context("field", fieldName);
    }
    return defaultValue;
}

int JsonUtils::getIntField(const nlohmann::json& json, const std::string& fieldName, int defaultValue) {
    if (!json.is_object() || !json.contains(fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_number_integer()) {
        return field.get<int>();
    } else if (field.is_number_float()) {
        return static_cast<int>(field.get<double>());
    } else if (field.is_string()) {
        try {
            return std::stoi(field.get<std::string>());
        } catch (const std::exception&) {
            SLOG_DEBUG().message("Cannot convert string field to integer, returning default").context("field", fieldName);
        }
    }
    return defaultValue;
}

bool JsonUtils::getBoolField(const nlohmann::json& json, const std::string& fieldName, bool defaultValue) {
    if (!json.is_object() || !json.contains(fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_boolean()) {
        return field.get<bool>();
    } else if (field.is_number()) {
        return field.get<double>() != 0.0;
    } else if (field.is_string()) {
        std::string value = StringUtils::toLowerCase(StringUtils::trim(field.get<std::string>()));
        if (value == "true" || value == "yes" || value == "1") return true;
        if (value == "false" || value == "no" || value == "0") return false;
    }
    return defaultValue;
}

double JsonUtils::getDoubleField(const nlohmann::json& json, const std::string& fieldName, double defaultValue) {
    if (!json.is_object() || !json.contains(fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_number()) {
        return field.get<double>();
    } else if (field.is_string()) {
        try {
            return std::stod(field.get<std::string>());
        } catch (const std::exception&) {
            SLOG_DEBUG().message("Cannot convert string field to double, returning default").context("field", fieldName);
        }
    }
    return defaultValue;
}

std::vector<std::string> JsonUtils::getStringArrayField(const nlohmann::json& json, const std::string& fieldName) {
    std::vector<std::string> values;
    if (!json.is_object() || !json.contains(fieldName) || !json[fieldName].is_array()) {
        return values;
    }
    for (const auto& item : json[fieldName]) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

const nlohmann::json* JsonUtils::findPath(const nlohmann::json& json, const std::string& path) {
    const nlohmann::json* current = &json;
    for (const auto& segment : StringUtils::split(path, ".")) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(segment);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

std::optional<nlohmann::json> JsonUtils::extractJsonObject(const std::string& text) {
    const std::string fence = "```";

    size_t jsonFence = text.find("```json");
    if (jsonFence != std::string::npos) {
        size_t start = jsonFence + 7;
        size_t end = text.find(fence, start);
        if (end != std::string::npos) {
            if (auto parsed = tryParseObject(text.substr(start, end - start))) {
                return parsed;
            }
        }
    }

    size_t anyFence = text.find(fence);
    if (anyFence != std::string::npos) {
        size_t start = text.find('\n', anyFence);
        size_t end = start == std::string::npos ? std::string::npos : text.find(fence, start);
        if (end != std::string::npos) {
            if (auto parsed = tryParseObject(text.substr(start, end - start))) {
                return parsed;
            }
        }
    }

    size_t open = text.find('{');
    size_t close = text.rfind('}');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        return tryParseObject(text.substr(open, close - open + 1));
    }

    return std::nullopt;
}

std::optional<nlohmann::json> JsonUtils::tryParseObject(const std::string& candidate) {
    nlohmann::json parsed = nlohmann::json::parse(StringUtils::trim(candidate), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace utils
} // namespace stepcoach
