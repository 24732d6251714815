// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <array>
#include <cstddef> // size_t
#include <limits>
#include <string_view>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <fmt/core.h>

#include "librendezvous/crypto-utils.h"
#include "librendezvous/log.h"
#include "librendezvous/rv-assert.h"
#include "librendezvous/rv-macros.h"

namespace
{
// OpenSSL calls return 1 on success
bool openssl_ok(int result, std::string_view what)
{
    if (result == 1)
    {
        return true;
    }

    auto const code = ERR_get_error();
    auto buf = std::array<char, 256>{};
    ERR_error_string_n(code, std::data(buf), std::size(buf));
    rv_logAddError(fmt::format(
        "OpenSSL {what} failed: {error} ({error_code})",
        fmt::arg("what", what),
        fmt::arg("error", std::data(buf)),
        fmt::arg("error_code", code)));
    return false;
}
} // namespace

rv_sha1_digest_t rv_sha1_digest(std::string_view data)
{
    auto digest = rv_sha1_digest_t{};
    auto digest_len = 0U;

    auto const ok = openssl_ok(
        EVP_Digest(
            std::data(data),
            std::size(data),
            reinterpret_cast<unsigned char*>(std::data(digest)),
            &digest_len,
            EVP_sha1(),
            nullptr),
        "SHA-1");
    RV_ASSERT(!ok || digest_len == std::size(digest));

    return digest;
}

bool rv_rand_buffer_crypto(void* buffer, size_t length)
{
    if (length == 0U)
    {
        return true;
    }

    if (length > static_cast<size_t>(std::numeric_limits<int>::max()))
    {
        return false;
    }

    return openssl_ok(RAND_bytes(static_cast<unsigned char*>(buffer), static_cast<int>(length)), "RAND_bytes");
}
