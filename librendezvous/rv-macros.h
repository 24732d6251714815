// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <array>
#include <cstddef> // std::byte

// ---

#ifndef __has_builtin
#define __has_builtin(x) 0
#endif

#if __has_builtin(__builtin_expect) || defined(__GNUC__)
#define RV_LIKELY(x) __builtin_expect((x) ? 1L : 0L, 1L)
#else
#define RV_LIKELY(x) (x)
#endif

#define RV_DISABLE_COPY_MOVE(Class) \
    Class& operator=(Class const&) = delete; \
    Class& operator=(Class&&) = delete; \
    Class(Class const&) = delete; \
    Class(Class&&) = delete;

// ---

// 20 random bytes, generated once per session. Trackers and peers
// see it hex-encoded.
using rv_peer_id_t = std::array<std::byte, 20>;

using rv_sha1_digest_t = std::array<std::byte, 20>;
