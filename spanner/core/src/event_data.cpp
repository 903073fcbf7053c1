#include <spanner/core/event_data.hpp>

#include <utility>

namespace spanner::core {

EventData::EventData(std::string message, Level level, std::string target)
    : EventData(std::move(message), level, std::move(target), Clock::now()) {}

EventData::EventData(std::string message, Level level, std::string target, Timestamp timestamp)
    : message_(std::move(message))
    , level_(level)
    , target_(std::move(target))
    , timestamp_(timestamp) {}

void EventData::add_field(std::string key, std::string value) {
    fields_.insert_or_assign(std::move(key), std::move(value));
}

} // namespace spanner::core
