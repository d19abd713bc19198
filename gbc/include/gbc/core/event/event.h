/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_EVENT_H
#define GAMEBOICOLOR_EVENT_H

#include <algorithm>

#include <gbc/core/event/delegate.h>
#include <gbc/core/container.h>

namespace gbc {

/**
 * Multicast delegate. Observers are invoked in the order they were added,
 * adding the same delegate twice is a no-op.
 */
template<typename... Args>
class event {
    vector<delegate<void(Args...)>> delegates_;

public:
    event() = default;

    void add_delegate(const delegate<void(Args...)> d)
    {
        if(std::find(delegates_.begin(), delegates_.end(), d) == delegates_.end()) {
            delegates_.push_back(d);
        }
    }

    template<typename... TArgs>
    void operator()(TArgs&&... args) const
    {
        for(const auto& d : delegates_) {
            d(std::forward<TArgs>(args)...);
        }
    }
};

} // namespace gbc

#endif //GAMEBOICOLOR_EVENT_H
