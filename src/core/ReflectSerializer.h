#pragma once

#include "reflect.h"
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>

/**
 * Reflection-driven JSON conversion for the aggregate settings structs.
 *
 * qlibs/reflect enumerates members at compile time; nlohmann/json does the value conversion.
 * Nested aggregates convert through their own ADL to_json/from_json overloads.
 *
 * Example:
 *   struct Rates { double regen_rate = 0.0; int radius = 1; };
 *   nlohmann::json j = EvoSim::ReflectSerializer::to_json(Rates{ 0.01, 2 });
 *   Rates r = EvoSim::ReflectSerializer::from_json<Rates>(j);
 */
namespace EvoSim::ReflectSerializer {

template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();

    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));
            j[name] = reflect::get<I>(obj);
        },
        obj);

    return j;
}

/**
 * Overlay the keys present in `j` onto `obj`, leaving absent members untouched.
 * Nested objects are merged member by member rather than replaced.
 */
template <typename T>
void merge(const nlohmann::json& j, T& obj)
{
    if (!j.is_object()) {
        return;
    }

    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));
            auto it = j.find(name);
            if (it == j.end()) {
                return;
            }

            auto& member = reflect::get<I>(obj);
            using MemberType = std::remove_cvref_t<decltype(member)>;
            if constexpr (std::is_aggregate_v<MemberType>) {
                merge(*it, member);
            }
            else {
                member = it->template get<MemberType>();
            }
        },
        obj);
}

/**
 * Build a value-initialized T and overlay `j` onto it.
 */
template <typename T>
T from_json(const nlohmann::json& j)
{
    T obj{};
    merge(j, obj);
    return obj;
}

} // namespace EvoSim::ReflectSerializer
