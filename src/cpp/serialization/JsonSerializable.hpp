/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "IsPointer.hpp"
#include "json_util.hpp"

//-------------------------------------------------------------------------

class JsonSerializable
{
public:
    virtual ~JsonSerializable() noexcept = default;

    virtual void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const = 0;

protected:
    JsonSerializable() noexcept = default;
};

//-------------------------------------------------------------------------

namespace loopvault::json
{

template<typename T>
concept IsJsonSerializable =
    requires (const T& t, rapidjson::Document& json, const std::string& key) {
        { t.jsonSerialize(json, key) };
    }
    || (mp::IsPointer<T> && requires (T t, rapidjson::Document& json, const std::string& key) {
        { t->jsonSerialize(json, key) };
    });

[[nodiscard]] std::string jsonSerializable2str(
    const IsJsonSerializable auto& serializable, const FormatOptions& formatOptions = {})
{
    rapidjson::Document json;
    if constexpr (mp::IsPointer<std::remove_cvref_t<decltype(serializable)>>) {
        serializable->jsonSerialize(json);
    } else {
        serializable.jsonSerialize(json);
    }
    return json2str(json, formatOptions);
}

}  // namespace loopvault::json

//-------------------------------------------------------------------------
