// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <algorithm>
#include <cstddef> // size_t, std::byte
#include <cstdint>
#include <iterator>
#include <random>
#include <string>

#include <fmt/core.h>

#include "librendezvous/crypto-utils.h"
#include "librendezvous/rv-macros.h"

std::string rv_sha1_to_string(rv_sha1_digest_t const& digest)
{
    auto str = std::string{};
    str.reserve(std::size(digest) * 2U);

    for (auto const byte : digest)
    {
        fmt::format_to(std::back_inserter(str), "{:02x}", std::to_integer<uint8_t>(byte));
    }

    return str;
}

void rv_rand_buffer_std(void* buffer, size_t length)
{
    thread_local auto engine = std::mt19937{ std::random_device{}() };
    auto dist = std::uniform_int_distribution<unsigned int>{ 0U, 255U };

    auto* const bytes = static_cast<std::byte*>(buffer);
    std::generate_n(bytes, length, [&]() { return static_cast<std::byte>(dist(engine)); });
}

void rv_rand_buffer(void* buffer, size_t length)
{
    if (!rv_rand_buffer_crypto(buffer, length))
    {
        rv_rand_buffer_std(buffer, length);
    }
}
