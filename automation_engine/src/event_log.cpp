#include <automation_engine/event_log.hpp>

namespace automation_engine
{

EventLog::EventLog(const std::size_t capacity)
: capacity_(capacity == 0 ? 1 : capacity)
{
}

void EventLog::push(const Event & event)
{
  std::scoped_lock lock(mutex_);

  entries_.push_front(event);
  while (entries_.size() > capacity_) {
    entries_.pop_back();
  }
}

void EventLog::clear()
{
  std::scoped_lock lock(mutex_);
  entries_.clear();
}

std::size_t EventLog::size() const
{
  std::scoped_lock lock(mutex_);
  return entries_.size();
}

std::vector<Event> EventLog::snapshot() const
{
  std::scoped_lock lock(mutex_);
  return std::vector<Event>(entries_.begin(), entries_.end());
}

}  // namespace automation_engine
