#include "superint/core/event_bus.h"

#include <algorithm>
#include <exception>

namespace superint {
namespace {

// Keeps current_chain() accurate even if a handler throws past us.
class ChainGuard {
 public:
  ChainGuard(std::vector<std::string>& chain, const std::string& topic) : chain_(chain) { chain_.push_back(topic); }
  ~ChainGuard() { chain_.pop_back(); }
  ChainGuard(const ChainGuard&) = delete;
  ChainGuard& operator=(const ChainGuard&) = delete;

 private:
  std::vector<std::string>& chain_;
};

} // namespace

EventBus::EventBus(Logger& log, std::size_t history_limit, std::size_t max_listeners)
    : log_(log),
      history_limit_(history_limit),
      max_listeners_(max_listeners),
      self_(std::make_shared<EventBus*>(this)) {}

EventBus::~EventBus() = default;

Unsubscribe EventBus::subscribe(const std::string& topic, Handler handler, std::string source) {
  auto sub = std::make_shared<Subscription>();
  sub->id = next_id_++;
  sub->handler = std::move(handler);
  sub->source = std::move(source);

  auto& list = subs_[topic];
  list.push_back(sub);
  if (max_listeners_ > 0 && list.size() > max_listeners_) {
    log_.warn("EventBus: topic '" + topic + "' has " + std::to_string(list.size()) +
              " listeners (warning threshold " + std::to_string(max_listeners_) + ")");
  }

  std::weak_ptr<EventBus*> weak = self_;
  const std::uint64_t id = sub->id;
  return [weak, topic, id]() {
    if (auto self = weak.lock()) (*self)->remove(topic, id);
  };
}

void EventBus::remove(const std::string& topic, std::uint64_t id) {
  auto it = subs_.find(topic);
  if (it == subs_.end()) return;
  auto& list = it->second;
  for (auto sit = list.begin(); sit != list.end(); ++sit) {
    if ((*sit)->id != id) continue;
    (*sit)->active = false;
    list.erase(sit);
    break;
  }
  if (list.empty()) subs_.erase(it);
}

void EventBus::emit(const std::string& topic, json::Value data, const std::string& source) {
  BusEvent ev;
  ev.topic = topic;
  ev.data = std::move(data);
  emit(std::move(ev), source);
}

void EventBus::emit(BusEvent event, const std::string& source) {
  EmissionRecord rec;
  rec.topic = event.topic;
  rec.source = source;
  rec.depth = static_cast<int>(chain_.size());
  if (!chain_.empty()) rec.parent_topic = chain_.back();
  if (history_limit_ > 0) {
    history_.push_back(rec);
    while (history_.size() > history_limit_) history_.pop_front();
  }

  if (debug_) {
    log_.debug("EventBus: emit '" + event.topic + "' depth=" + std::to_string(rec.depth) +
               (source.empty() ? std::string() : " source=" + source));
  }

  auto it = subs_.find(event.topic);
  if (it == subs_.end()) return;

  // Snapshot: subscriptions added by a handler are not part of this emission.
  const std::vector<std::shared_ptr<Subscription>> snapshot = it->second;

  ChainGuard guard(chain_, event.topic);
  for (const auto& sub : snapshot) {
    if (!sub->active) continue;
    try {
      sub->handler(event);
    } catch (const std::exception& e) {
      log_.error("EventBus: handler for '" + event.topic + "'" +
                 (sub->source.empty() ? std::string() : " (source: " + sub->source + ")") + " failed: " + e.what() +
                 " [chain: " + chain_string() + "]");
    }
  }
}

std::size_t EventBus::listener_count(const std::string& topic) const {
  auto it = subs_.find(topic);
  return it == subs_.end() ? 0 : it->second.size();
}

std::vector<EmissionRecord> EventBus::history(std::size_t limit) const {
  const std::size_t n = (limit == 0 || limit > history_.size()) ? history_.size() : limit;
  return std::vector<EmissionRecord>(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
}

std::string EventBus::chain_string() const {
  std::string out;
  for (const auto& t : chain_) {
    if (!out.empty()) out += " > ";
    out += t;
  }
  return out;
}

} // namespace superint
