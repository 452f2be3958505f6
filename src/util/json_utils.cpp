#include "util/json_utils.hpp"

#include "io/file_reader.hpp"

#include <algorithm>

namespace genup::json_utils {

namespace {

bool IsInteger(const nlohmann::json& v) {
    return v.is_number_integer() || v.is_number_unsigned();
}

bool IsNonNegativeInteger(const nlohmann::json& v) {
    return v.is_number_unsigned() || (v.is_number_integer() && v.get<std::int64_t>() >= 0);
}

// Copies j[key] into `out` when present and `accept` approves of it.
template <typename T, typename Accept>
bool Extract(const nlohmann::json& j, const char* key, T& out, Accept accept) {
    const auto it = j.find(key);
    if (it == j.end() || !accept(*it))
        return false;
    out = it->template get<T>();
    return true;
}

} // namespace

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    return Extract(j, key, out, [](const nlohmann::json& v) { return v.is_string(); });
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    return Extract(j, key, out, IsNonNegativeInteger);
}

bool GetI64IfPresent(const nlohmann::json& j, const char* key, std::int64_t& out) {
    return Extract(j, key, out, IsInteger);
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out) {
    return Extract(j, key, out, [](const nlohmann::json& v) { return v.is_boolean(); });
}

bool GetStringArrayIfPresent(const nlohmann::json& j, const char* key, std::vector<std::string>& out) {
    return Extract(j, key, out, [](const nlohmann::json& v) {
        return v.is_array() &&
               std::all_of(v.begin(), v.end(), [](const nlohmann::json& e) { return e.is_string(); });
    });
}

bool HasWrongType(const nlohmann::json& j, const char* key, nlohmann::json::value_t expected) {
    const auto it = j.find(key);
    if (it == j.end())
        return false;
    if (expected == nlohmann::json::value_t::number_unsigned)
        return !IsNonNegativeInteger(*it);
    return it->type() != expected;
}

bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        err = "invalid JSON near byte " + std::to_string(e.byte);
        return false;
    }
    if (!out.is_object()) {
        err = std::string("expected a JSON object, got ") + out.type_name();
        return false;
    }
    return true;
}

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::string text;
    if (auto r = ReadFileToString(path, text); !r.ok) {
        err = r.msg;
        return false;
    }
    if (!ParseJsonObject(text, out, err)) {
        err = path + ": " + err;
        return false;
    }
    return true;
}

} // namespace genup::json_utils
