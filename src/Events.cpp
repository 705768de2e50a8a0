#include "camring/Events.hpp"
#include <iostream>

namespace camring {

const char* to_string(FrameStoreEventKind kind)
{
    switch (kind) {
    case FrameStoreEventKind::Opened:           return "opened";
    case FrameStoreEventKind::Closed:           return "closed";
    case FrameStoreEventKind::RecordingPaused:  return "recording paused";
    case FrameStoreEventKind::RecordingResumed: return "recording resumed";
    case FrameStoreEventKind::MetadataDropped:  return "metadata dropped";
    case FrameStoreEventKind::CloseFailed:      return "close failed";
    }
    return "unknown";
}

EventSink stderr_sink()
{
    return [](const FrameStoreEvent& ev) {
        std::cerr << "FrameStore: " << to_string(ev.kind) << ": " << ev.message << "\n";
    };
}

} // namespace camring
