// Ordered list of callbacks for one lifecycle event.
#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace Sprig {

using HandlerId = std::uint64_t;
constexpr HandlerId kInvalidHandler = 0;

template <typename... Args>
class HandlerList {
public:
    using Fn = std::function<void(Args...)>;

    // Appends fn; the same callable may be registered more than once.
    HandlerId add(Fn fn) {
        const HandlerId id = ++lastIssued_;
        entries_.push_back(Entry{id, std::move(fn)});
        return id;
    }

    // Removes the registration issued as id. Returns false if it is not present.
    bool remove(HandlerId id) {
        auto it = std::find_if(entries_.begin(), entries_.end(), [id](const Entry& e) { return e.id == id; });
        if (it == entries_.end()) {
            return false;
        }
        entries_.erase(it);
        return true;
    }

    // Runs every handler in registration order. Iterates a snapshot so handlers
    // can register or remove handlers on this list while it is being invoked.
    void invoke(Args... args) const {
        if (entries_.empty()) {
            return;
        }
        const std::vector<Entry> snapshot = entries_;
        for (const auto& entry : snapshot) {
            if (entry.fn) {
                entry.fn(args...);
            }
        }
    }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    struct Entry {
        HandlerId id{kInvalidHandler};
        Fn fn;
    };

    std::vector<Entry> entries_;
    HandlerId lastIssued_{kInvalidHandler};
};

}  // namespace Sprig
