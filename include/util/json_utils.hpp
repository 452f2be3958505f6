#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace genup::json_utils {

// Getters return false when the key is absent or has the wrong type; `out` is
// untouched in that case.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out);
bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out);
bool GetI64IfPresent(const nlohmann::json& j, const char* key, std::int64_t& out);
bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out);
bool GetStringArrayIfPresent(const nlohmann::json& j, const char* key, std::vector<std::string>& out);

// True when `key` exists but does not have the expected type.
bool HasWrongType(const nlohmann::json& j, const char* key, nlohmann::json::value_t expected);

bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err);
bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);

} // namespace genup::json_utils
