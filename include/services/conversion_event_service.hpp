#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace t2t {

class ConversionEventService {
 public:
  struct ConversionEvent {
    enum Kind { CONVERTED, READBACK_ERROR };
    uint64_t sequence;
    Kind kind;
    std::string message;
    double elapsed_ms;
  };

  explicit ConversionEventService(size_t capacity = 256) : capacity_(capacity) {}

  // Oldest events are dropped once `capacity` undrained events are queued.
  void push(uint64_t sequence, ConversionEvent::Kind kind,
            const std::string& message, double ms);
  std::vector<ConversionEvent> drain();
  size_t dropped() const;

 private:
  size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<ConversionEvent> buffer_;
  size_t dropped_ = 0;
};

const char* event_kind_name(ConversionEventService::ConversionEvent::Kind kind);

}  // namespace t2t
