#include "services/conversion_event_service.hpp"

namespace t2t {

void ConversionEventService::push(uint64_t sequence,
                                  ConversionEvent::Kind kind,
                                  const std::string& message,
                                  double ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ == 0) {
        ++dropped_;
        return;
    }
    if (buffer_.size() >= capacity_) {
        buffer_.pop_front();
        ++dropped_;
    }
    buffer_.push_back(ConversionEvent{ sequence, kind, message, ms });
}

std::vector<ConversionEventService::ConversionEvent> ConversionEventService::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConversionEvent> out(buffer_.begin(), buffer_.end());
    buffer_.clear();
    return out;
}

size_t ConversionEventService::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

const char* event_kind_name(ConversionEventService::ConversionEvent::Kind kind) {
    switch (kind) {
        case ConversionEventService::ConversionEvent::CONVERTED: return "CONVERTED";
        case ConversionEventService::ConversionEvent::READBACK_ERROR: return "READBACK_ERROR";
    }
    return "UNKNOWN";
}

} // namespace t2t
