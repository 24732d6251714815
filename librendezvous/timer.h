// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include "librendezvous/rv-macros.h"

namespace librendezvous
{

/**
 * A timer on the embedding application's event loop.
 *
 * The callback always runs from the event loop, never from inside
 * `arm()`. Destroying the timer cancels it.
 */
class Timer
{
public:
    enum class Mode
    {
        SingleShot,
        Repeating
    };

    Timer() = default;
    virtual ~Timer() = default;

    RV_DISABLE_COPY_MOVE(Timer)

    // (Re)start the countdown. A zero delay means "as soon as the loop is idle".
    virtual void arm(std::chrono::milliseconds delay, Mode mode) = 0;
    virtual void disarm() = 0;

    [[nodiscard]] virtual bool is_armed() const noexcept = 0;
};

class TimerMaker
{
public:
    virtual ~TimerMaker() = default;

    [[nodiscard]] virtual std::unique_ptr<Timer> create(std::function<void()> callback) = 0;
};

} // namespace librendezvous
