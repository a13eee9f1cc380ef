#include "keyboard.hpp"
#include <algorithm>
#include <utility>

Subscription::Subscription(std::function<void()> remover) : remover_(std::move(remover)) {}

Subscription::Subscription(Subscription &&other) noexcept : remover_(std::move(other.remover_)) {
  other.remover_ = nullptr;
}

Subscription &Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    remove();
    remover_ = std::move(other.remover_);
    other.remover_ = nullptr;
  }
  return *this;
}

Subscription::~Subscription() { remove(); }

void Subscription::remove() {
  if (!remover_)
    return;
  auto r = std::move(remover_);
  remover_ = nullptr;
  r();
}

KeyboardEmitter::KeyboardEmitter() : reg_(std::make_shared<Registry>()) {}

Subscription KeyboardEmitter::addListener(srx::KeyboardEventType type, KeyboardHandler handler) {
  const int id = reg_->nextId++;
  reg_->listeners.push_back({id, type, std::move(handler)});
  std::weak_ptr<Registry> weak = reg_;
  return Subscription([weak, id]() {
    auto reg = weak.lock();
    if (!reg)
      return;
    auto &ls = reg->listeners;
    ls.erase(std::remove_if(ls.begin(), ls.end(), [id](const Listener &l) { return l.id == id; }),
             ls.end());
  });
}

void KeyboardEmitter::publish(srx::KeyboardEventType type, const std::optional<srx::KeyboardEvent> &e) {
  // snapshot ids: a listener may add or remove listeners while we dispatch
  std::vector<int> ids;
  for (const auto &l : reg_->listeners)
    if (l.type == type)
      ids.push_back(l.id);

  auto reg = reg_;
  for (int id : ids) {
    auto it = std::find_if(reg->listeners.begin(), reg->listeners.end(),
                           [id](const Listener &l) { return l.id == id; });
    if (it == reg->listeners.end())
      continue;
    KeyboardHandler fn = it->fn;
    if (fn)
      fn(e);
  }
}

std::size_t KeyboardEmitter::listenerCount(srx::KeyboardEventType type) const {
  return std::size_t(std::count_if(reg_->listeners.begin(), reg_->listeners.end(),
                                   [type](const Listener &l) { return l.type == type; }));
}
