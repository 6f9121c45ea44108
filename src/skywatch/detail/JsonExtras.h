#pragma once
// src/skywatch/detail/JsonExtras.h
//
// Forward-compatible JSON helpers shared by the (de)serializers: fields a reader does not
// know about are collected into an `extras` object and merged back on write.

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <string>
#include <unordered_set>

namespace skywatch::detail {

using json = nlohmann::json;

inline json collect_extras(const json& obj, std::initializer_list<const char*> known)
{
    json extras = json::object();
    if (!obj.is_object()) return extras;

    std::unordered_set<std::string> known_set;
    known_set.reserve(known.size());
    for (auto* k : known) known_set.emplace(k);

    for (const auto& [k, v] : obj.items()) {
        if (!known_set.count(k)) extras[k] = v;
    }
    return extras;
}

inline void merge_extras(json& dst, const json& extras)
{
    if (!dst.is_object() || !extras.is_object()) return;
    for (const auto& [k, v] : extras.items()) {
        // Do not overwrite known fields; only add missing ones.
        if (!dst.contains(k)) { dst[k] = v; }
    }
}

} // namespace skywatch::detail
