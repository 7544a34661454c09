#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace vshell {

using Unsubscribe = std::function<void()>;

// Subscriber registry keyed by event kind. Each subscription hands back an
// unsubscribe callback that stays safe to call after the hub is gone.
template <typename Kind, typename Payload> class EventHub {
  public:
    using Handler = std::function<void(const Payload &)>;

    EventHub() : state_(std::make_shared<State>()) {}

    EventHub(const EventHub &) = delete;
    EventHub &operator=(const EventHub &) = delete;

    Unsubscribe subscribe(Kind kind, Handler handler) {
        std::uint64_t id = 0;
        {
            std::lock_guard lock(state_->mutex);
            id = state_->next_id++;
            state_->subscribers[kind].push_back(Slot{.id = id, .handler = std::move(handler)});
        }

        std::weak_ptr<State> weak = state_;
        return [weak, kind, id]() {
            if (auto state = weak.lock()) {
                std::lock_guard lock(state->mutex);
                auto &slots = state->subscribers[kind];
                std::erase_if(slots, [id](const Slot &slot) { return slot.id == id; });
            }
        };
    }

    void emit(Kind kind, const Payload &payload) const {
        std::vector<Handler> handlers;
        {
            std::lock_guard lock(state_->mutex);
            auto it = state_->subscribers.find(kind);
            if (it == state_->subscribers.end()) {
                return;
            }
            for (const auto &slot : it->second) {
                handlers.push_back(slot.handler);
            }
        }

        for (const auto &handler : handlers) {
            handler(payload);
        }
    }

  private:
    struct Slot {
        std::uint64_t id;
        Handler handler;
    };

    struct State {
        std::mutex mutex;
        std::map<Kind, std::vector<Slot>> subscribers;
        std::uint64_t next_id{1};
    };

    std::shared_ptr<State> state_;
};

} // namespace vshell
