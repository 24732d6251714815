// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "librendezvous/error-types.h"
#include "librendezvous/error.h"
#include "librendezvous/log.h"
#include "librendezvous/session-settings.h"
#include "librendezvous/utils.h"

using namespace std::literals;

namespace
{
auto constexpr KeyAnnounceUrls = "announce-urls"sv;
auto constexpr KeyIdentifier = "identifier"sv;
auto constexpr KeyMessageLevel = "message-level"sv;
auto constexpr KeyNumwant = "numwant"sv;
auto constexpr KeyReannounceInterval = "reannounce-interval"sv;

[[nodiscard]] rapidjson::Value::ConstMemberIterator find_member(rapidjson::Value const& obj, std::string_view key)
{
    return obj.FindMember(rapidjson::Value{ std::data(key), static_cast<rapidjson::SizeType>(std::size(key)) });
}

bool set_type_error(rv_error* error, std::string_view key, std::string_view expected)
{
    rv_error_set(
        error,
        RV_ERROR_EINVAL,
        fmt::format("Setting '{key}' should be {expected}", fmt::arg("key", key), fmt::arg("expected", expected)));
    return false;
}

bool load_string(rapidjson::Value const& obj, std::string_view key, std::string* setme, rv_error* error)
{
    auto const iter = find_member(obj, key);
    if (iter == obj.MemberEnd())
    {
        return true;
    }

    if (!iter->value.IsString())
    {
        return set_type_error(error, key, "a string"sv);
    }

    setme->assign(iter->value.GetString(), iter->value.GetStringLength());
    return true;
}

bool load_string_list(rapidjson::Value const& obj, std::string_view key, std::vector<std::string>* setme, rv_error* error)
{
    auto const iter = find_member(obj, key);
    if (iter == obj.MemberEnd())
    {
        return true;
    }

    if (!iter->value.IsArray())
    {
        return set_type_error(error, key, "a list of strings"sv);
    }

    auto list = std::vector<std::string>{};
    list.reserve(iter->value.Size());
    for (auto const& item : iter->value.GetArray())
    {
        if (!item.IsString())
        {
            return set_type_error(error, key, "a list of strings"sv);
        }

        list.emplace_back(item.GetString(), item.GetStringLength());
    }

    *setme = std::move(list);
    return true;
}

bool load_int(rapidjson::Value const& obj, std::string_view key, int min_value, int* setme, rv_error* error)
{
    auto const iter = find_member(obj, key);
    if (iter == obj.MemberEnd())
    {
        return true;
    }

    if (!iter->value.IsInt() || iter->value.GetInt() < min_value)
    {
        return set_type_error(error, key, fmt::format("an integer >= {:d}", min_value));
    }

    *setme = iter->value.GetInt();
    return true;
}

// accepts either a level name ("warn") or its number (3)
bool load_log_level(rapidjson::Value const& obj, std::string_view key, rv_log_level* setme, rv_error* error)
{
    auto const iter = find_member(obj, key);
    if (iter == obj.MemberEnd())
    {
        return true;
    }

    auto const& val = iter->value;
    if (val.IsString())
    {
        if (auto const level = rv_logGetLevelFromKey({ val.GetString(), val.GetStringLength() }); level)
        {
            *setme = *level;
            return true;
        }
    }
    else if (val.IsInt() && val.GetInt() >= RV_LOG_OFF && val.GetInt() <= RV_LOG_TRACE)
    {
        *setme = static_cast<rv_log_level>(val.GetInt());
        return true;
    }

    return set_type_error(error, key, "a log level"sv);
}

} // namespace

bool rv_session_settings::load(std::string_view json, rv_error* error)
{
    auto doc = rapidjson::Document{};
    doc.Parse(std::data(json), std::size(json));
    if (doc.HasParseError())
    {
        rv_error_set(
            error,
            RV_ERROR_EINVAL,
            fmt::format(
                "Couldn't parse settings: {error} at offset {offset}",
                fmt::arg("error", rapidjson::GetParseError_En(doc.GetParseError())),
                fmt::arg("offset", doc.GetErrorOffset())));
        return false;
    }

    if (!doc.IsObject())
    {
        rv_error_set(error, RV_ERROR_EINVAL, "Settings should be a JSON object");
        return false;
    }

    auto tmp = *this;
    auto reannounce_secs = static_cast<int>(tmp.reannounce_interval.count());

    if (!load_string_list(doc, KeyAnnounceUrls, &tmp.announce_urls, error) ||
        !load_string(doc, KeyIdentifier, &tmp.identifier, error) ||
        !load_int(doc, KeyNumwant, 0, &tmp.numwant, error) ||
        !load_int(doc, KeyReannounceInterval, 0, &reannounce_secs, error) ||
        !load_log_level(doc, KeyMessageLevel, &tmp.log_level, error))
    {
        return false;
    }

    tmp.reannounce_interval = std::chrono::seconds{ reannounce_secs };
    *this = std::move(tmp);
    return true;
}

bool rv_session_settings::load_file(std::string_view filename, rv_error* error)
{
    auto const contents = rv_file_read(filename, error);
    if (!contents)
    {
        return false;
    }

    if (auto local_error = rv_error{}; !load(*contents, &local_error))
    {
        local_error.add_context(filename);
        rv_logAddError(std::string{ local_error.message() });
        rv_error_propagate(error, std::move(local_error));
        return false;
    }

    return true;
}
