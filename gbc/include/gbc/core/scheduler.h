/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_SCHEDULER_H
#define GAMEBOICOLOR_SCHEDULER_H

#include <algorithm>
#include <functional>   // std::greater
#include <string_view>
#include <utility>

#include <gbc/core/container.h>
#include <gbc/core/event/delegate.h>

#define MAKE_HW_EVENT_V(callback, instance) {connect_arg<&callback>, instance}
#define MAKE_HW_EVENT(callback) MAKE_HW_EVENT_V(callback, this)

namespace gbc {

/** Maps event callbacks to stable names so pending events survive a save state. */
class hw_event_registry {
public:
    struct entry {
        delegate<void(u32)> callback;
        std::string_view name;

        entry(const delegate<void(u32)> cb, const std::string_view n) noexcept
          : callback(cb), name(n) {}
    };

private:
    vector<entry> entries_;

public:
    void register_entry(const delegate<void(u32)> callback, const std::string_view name)
    {
        if(find_by_name(name) == nullptr) {
            entries_.emplace_back(callback, name);
            LOG_DEBUG(hw_event_registry, "event registered: {}", name);
        }
    }

    [[nodiscard]] const entry* find_by_name(const std::string_view name) const noexcept
    {
        const auto it = std::find_if(entries_.begin(),  entries_.end(), [&](const entry& entry) {
            return entry.name == name;
        });
        return it == entries_.end() ? nullptr : &*it;
    }

    [[nodiscard]] const entry* find_by_callback(const delegate<void(u32)> cb) const noexcept
    {
        const auto it = std::find_if(entries_.begin(),  entries_.end(), [&](const entry& entry) {
            return entry.callback == cb;
        });
        return it == entries_.end() ? nullptr : &*it;
    }
};

/**
 * Monotonic cycle clock of the machine. Besides keeping the time, it fires
 * hardware events (e.g. serial transfer completion) once the clock passes their timestamp.
 * The clock only moves forward through add_cycles.
 */
class scheduler {
public:
    // represents an hardware event
    struct hw_event {
        using handle = u64;

        delegate<void(u32 /*late_cycles*/)> callback;
        u64 timestamp;
        handle h;

        bool operator>(const hw_event& other) const noexcept { return timestamp > other.timestamp; }
    };

private:
    using predicate = std::greater<scheduler::hw_event>;

    hw_event_registry registry_;
    vector<hw_event> heap_;
    u64 now_;
    u64 next_event_handle_;

public:
    scheduler()
    {
        heap_.reserve(64_usize);
    }

    // every callback that may be pending during a save must be registered
    void register_hw_event(const delegate<void(u32)> callback, const std::string_view name)
    {
        registry_.register_entry(callback, name);
    }

    hw_event::handle add_hw_event(const u32 delay, const delegate<void(u32)> callback)
    {
        heap_.push_back(hw_event{callback, now_ + delay, ++next_event_handle_});
        std::push_heap(heap_.begin(), heap_.end(), predicate{});
        return next_event_handle_;
    }

    [[nodiscard]] bool has_event(const hw_event::handle handle) const noexcept
    {
        const auto it = std::find_if(heap_.begin(), heap_.end(), [handle](const hw_event& e) {
            return e.h == handle;
        });

        return it != heap_.end();
    }

    void remove_event(const hw_event::handle handle)
    {
        const auto it = std::remove_if(heap_.begin(), heap_.end(), [handle](const hw_event& e) {
            return e.h == handle;
        });

        if(it != heap_.end()) {
            heap_.erase(it, heap_.end());
            std::make_heap(heap_.begin(), heap_.end(), predicate{});
        }
    }

    void add_cycles(const u32 cycles) noexcept
    {
        now_ += cycles;
        while(!heap_.empty() && heap_.front().timestamp <= now_) {
            const hw_event due = heap_.front();
            std::pop_heap(heap_.begin(), heap_.end(), predicate{});
            heap_.pop_back();

            due.callback(narrow<u32>(now_ - due.timestamp));
        }
    }

    [[nodiscard]] u64 now() const noexcept { return now_; }

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(heap_.size());
        for(const hw_event& event : heap_) {
            const hw_event_registry::entry* event_entry = registry_.find_by_callback(event.callback);
            if(!event_entry) {
                LOG_CRITICAL(scheduler, "unregistered event callback");
                PANIC();
            }

            archive.serialize(event_entry->name);
            archive.serialize(event.timestamp);
            archive.serialize(event.h);
        }
        archive.serialize(now_);
        archive.serialize(next_event_handle_);
    }

    template<typename Ar>
    void deserialize(const Ar& archive)
    {
        const auto count = archive.template deserialize<usize>();
        vector<hw_event> heap;
        for(usize i = 0_usize; i < count && !archive.corrupted(); ++i) {
            const auto event_name = archive.template deserialize<std::string_view>();
            const hw_event_registry::entry* event_entry = registry_.find_by_name(event_name);
            if(!event_entry) {
                LOG_ERROR(scheduler, "corrupted serialized event data {}", event_name);
                archive.mark_corrupted();
                return;
            }

            hw_event event;
            event.callback = event_entry->callback;
            archive.deserialize(event.timestamp);
            archive.deserialize(event.h);
            heap.push_back(event);
        }

        u64 now;
        u64 next_handle;
        archive.deserialize(now);
        archive.deserialize(next_handle);
        if(archive.corrupted()) {
            return;
        }

        heap_ = std::move(heap);
        std::make_heap(heap_.begin(), heap_.end(), predicate{});
        now_ = now;
        next_event_handle_ = next_handle;
    }
};

} // namespace gbc

#endif //GAMEBOICOLOR_SCHEDULER_H
