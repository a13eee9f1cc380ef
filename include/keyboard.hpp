#pragma once
#include "events.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

using KeyboardHandler = std::function<void(const std::optional<srx::KeyboardEvent> &)>;

// Owns one listener registration. remove() is idempotent; the destructor removes.
class Subscription {
public:
  Subscription() = default;
  explicit Subscription(std::function<void()> remover);
  Subscription(Subscription &&other) noexcept;
  Subscription &operator=(Subscription &&other) noexcept;
  Subscription(const Subscription &) = delete;
  Subscription &operator=(const Subscription &) = delete;
  ~Subscription();

  void remove();
  bool active() const { return static_cast<bool>(remover_); }

private:
  std::function<void()> remover_;
};

class KeyboardBroadcaster {
public:
  virtual ~KeyboardBroadcaster() = default;
  virtual Subscription addListener(srx::KeyboardEventType type, KeyboardHandler handler) = 0;
};

// In-process broadcaster. Listeners of one event type run in registration order.
class KeyboardEmitter : public KeyboardBroadcaster {
public:
  KeyboardEmitter();

  Subscription addListener(srx::KeyboardEventType type, KeyboardHandler handler) override;
  void publish(srx::KeyboardEventType type, const std::optional<srx::KeyboardEvent> &e);
  std::size_t listenerCount(srx::KeyboardEventType type) const;

private:
  struct Listener {
    int id;
    srx::KeyboardEventType type;
    KeyboardHandler fn;
  };
  struct Registry {
    std::vector<Listener> listeners;
    int nextId = 1;
  };
  // shared so outstanding Subscriptions stay safe if the emitter dies first
  std::shared_ptr<Registry> reg_;
};
