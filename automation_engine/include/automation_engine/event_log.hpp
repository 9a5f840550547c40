#pragma once

#include <automation_engine/event_types.hpp>

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace automation_engine
{

/// Bounded history of recently handled events, newest first.
class EventLog
{
public:
  explicit EventLog(std::size_t capacity);

  void push(const Event & event);
  void clear();

  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }
  std::vector<Event> snapshot() const;

private:
  std::size_t capacity_{50};
  mutable std::mutex mutex_;
  std::deque<Event> entries_;
};

}  // namespace automation_engine
