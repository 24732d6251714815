// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

struct rv_error;

/**
 * @addtogroup utils Utilities
 * @{
 */

/** @brief Convenience wrapper around `strerorr()` guaranteed to not return nullptr
    @param errnum the error number to describe */
[[nodiscard]] char const* rv_strerror(int errnum);

template<typename T>
[[nodiscard]] std::string rv_strlower(T in)
{
    auto out = std::string{ std::move(in) };
    std::for_each(std::begin(out), std::end(out), [](char& ch) { ch = std::tolower(static_cast<unsigned char>(ch)); });
    return out;
}

// --- std::string_view utils

template<typename T>
[[nodiscard]] constexpr bool rv_strv_contains(std::string_view sv, T key) noexcept // c++23
{
    return sv.find(key) != std::string_view::npos;
}

[[nodiscard]] constexpr bool rv_strv_starts_with(std::string_view sv, char key) // c++20
{
    return !std::empty(sv) && sv.front() == key;
}

[[nodiscard]] constexpr bool rv_strv_starts_with(std::string_view sv, std::string_view key) // c++20
{
    return std::size(key) <= std::size(sv) && sv.substr(0, std::size(key)) == key;
}

constexpr std::string_view rv_strv_sep(std::string_view* sv, char delim)
{
    auto pos = sv->find(delim);
    auto const ret = sv->substr(0, pos);
    sv->remove_prefix(pos != std::string_view::npos ? pos + 1 : std::size(*sv));
    return ret;
}

[[nodiscard]] std::string_view rv_strv_strip(std::string_view str);

// ---

/**
 * @brief Load a file's contents into a string.
 * @return the contents, or std::nullopt and `error` set on failure
 */
[[nodiscard]] std::optional<std::string> rv_file_read(std::string_view filename, rv_error* error = nullptr);

/** @} */
