#ifndef ECHAT_SYNC_JSON_HELPERS_HPP
#define ECHAT_SYNC_JSON_HELPERS_HPP

// Lenient accessors for protocol JSON: a missing or mistyped field reads as
// empty instead of throwing.

#include <cstdint>
#include <cstdio>
#include <string>

#include <nlohmann/json.hpp>

namespace echat::sync::detail
{
    inline const nlohmann::json &json_member(const nlohmann::json &j, const char *key)
    {
        static const nlohmann::json empty = nlohmann::json::object();
        if (!j.is_object())
            return empty;
        auto it = j.find(key);
        return it != j.end() ? *it : empty;
    }

    inline const nlohmann::json &json_member(const nlohmann::json &j, const std::string &key)
    {
        return json_member(j, key.c_str());
    }

    inline std::string json_string(const nlohmann::json &j, const char *key)
    {
        const auto &v = json_member(j, key);
        return v.is_string() ? v.get<std::string>() : std::string{};
    }

    inline std::int64_t json_int(const nlohmann::json &j, const char *key, std::int64_t fallback = 0)
    {
        const auto &v = json_member(j, key);
        return v.is_number_integer() ? v.get<std::int64_t>() : fallback;
    }

    /// TDLib ships 64-bit ids either as numbers or as strings.
    inline std::string json_id(const nlohmann::json &j, const char *key)
    {
        const auto &v = json_member(j, key);
        if (v.is_string())
            return v.get<std::string>();
        if (v.is_number_integer())
            return std::to_string(v.get<std::int64_t>());
        return {};
    }

    /// FNV-1a, 32 bit, as eight lowercase hex digits. Stable across processes.
    inline std::string fnv32hex(const std::string &s)
    {
        std::uint32_t h = 2166136261u;
        for (unsigned char c : s)
        {
            h ^= c;
            h *= 16777619u;
        }
        char buf[9];
        std::snprintf(buf, sizeof(buf), "%08x", h);
        return buf;
    }
} // namespace echat::sync::detail

#endif // ECHAT_SYNC_JSON_HELPERS_HPP
