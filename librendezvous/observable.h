// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <cstddef> // size_t
#include <functional>
#include <utility>
#include <vector>

#include <small/map.hpp>

#include "librendezvous/rv-assert.h"

namespace librendezvous
{

// Cancels its subscription when destroyed or reset.
class ObserverTag
{
public:
    ObserverTag() = default;

    explicit ObserverTag(std::function<void()> cancel)
        : cancel_{ std::move(cancel) }
    {
    }

    ObserverTag(ObserverTag&& that) noexcept
        : cancel_{ std::exchange(that.cancel_, nullptr) }
    {
    }

    ObserverTag& operator=(ObserverTag&& that) noexcept
    {
        reset();
        cancel_ = std::exchange(that.cancel_, nullptr);
        return *this;
    }

    ObserverTag(ObserverTag const&) = delete;
    ObserverTag& operator=(ObserverTag const&) = delete;

    ~ObserverTag()
    {
        reset();
    }

    void reset()
    {
        if (auto const cancel = std::exchange(cancel_, nullptr); cancel)
        {
            cancel();
        }
    }

private:
    std::function<void()> cancel_;
};

// Single-threaded observer list for the session's events.
//
// Observers may subscribe or unsubscribe from inside a callback.
// Ones added during an emit first hear the next one; ones removed
// during an emit are not called again, not even by that emit.
template<typename... Args>
class SimpleObservable
{
    using Key = size_t;

public:
    using Observer = std::function<void(Args...)>;

    SimpleObservable() = default;
    SimpleObservable(SimpleObservable&&) = delete;
    SimpleObservable(SimpleObservable const&) = delete;
    SimpleObservable& operator=(SimpleObservable&&) = delete;
    SimpleObservable& operator=(SimpleObservable const&) = delete;

    ~SimpleObservable()
    {
        // every tag must be gone; they point back at us
        RV_ASSERT(std::empty(observers_));
    }

    [[nodiscard]] ObserverTag observe(Observer observer)
    {
        auto const key = next_key_++;
        observers_.emplace(key, std::move(observer));
        return ObserverTag{ [this, key]() { observers_.erase(key); } };
    }

    void emit(Args... args) const
    {
        auto keys = std::vector<Key>{};
        keys.reserve(std::size(observers_));
        for (auto const& [key, observer] : observers_)
        {
            keys.emplace_back(key);
        }

        for (auto const key : keys)
        {
            if (auto const iter = observers_.find(key); iter != std::end(observers_))
            {
                // the callback may unsubscribe itself
                auto const observer = iter->second;
                observer(args...);
            }
        }
    }

    [[nodiscard]] size_t size() const noexcept
    {
        return std::size(observers_);
    }

private:
    small::map<Key, Observer, 4U> observers_;
    Key next_key_ = 1U;
};

} // namespace librendezvous
