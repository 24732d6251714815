// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <string>
#include <string_view>
#include <utility>

/**
 * An errno-style code plus a message for people to read.
 * A zero code means "no error".
 */
struct rv_error
{
public:
    rv_error() = default;

    rv_error(int code, std::string message)
        : message_{ std::move(message) }
        , code_{ code }
    {
    }

    [[nodiscard]] constexpr int code() const noexcept
    {
        return code_;
    }

    [[nodiscard]] std::string_view message() const noexcept
    {
        return message_;
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept
    {
        return code_ != 0;
    }

    void set(int code, std::string_view message);

    // "context: message", e.g. to say which file a parse error came from
    void add_context(std::string_view context);

private:
    std::string message_;
    int code_ = 0;
};

// Helpers for the `rv_error* error = nullptr` out-parameter convention.
// Each is a no-op when `error` is nullptr.

void rv_error_set(rv_error* error, int code, std::string_view message);

// code is `errnum`, message is its strerror() text
void rv_error_set_from_errno(rv_error* error, int errnum);

void rv_error_propagate(rv_error* tgt, rv_error&& src);
