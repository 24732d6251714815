// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <cstddef> // size_t
#include <string>
#include <string_view>

#include "librendezvous/rv-macros.h" // rv_sha1_digest_t

/**
 * @addtogroup utils Utilities
 * @{
 */

// SHA-1 of `data`. Used to turn an application identifier into a lookup key.
[[nodiscard]] rv_sha1_digest_t rv_sha1_digest(std::string_view data);

// lowercase hex, e.g. for announcing an info hash or peer id
[[nodiscard]] std::string rv_sha1_to_string(rv_sha1_digest_t const& digest);

// Fill a buffer with random bytes from the crypto library,
// or from a std::random_device-seeded engine if that fails.
void rv_rand_buffer(void* buffer, size_t length);

// These two are only exposed for open-box tests.
[[nodiscard]] bool rv_rand_buffer_crypto(void* buffer, size_t length);
void rv_rand_buffer_std(void* buffer, size_t length);

template<typename T>
[[nodiscard]] T rv_rand_obj()
{
    auto t = T{};
    rv_rand_buffer(&t, sizeof(T));
    return t;
}

/** @} */
