#pragma once
#include <functional>
#include <string>

namespace camring {

enum class FrameStoreEventKind {
    Opened,
    Closed,
    RecordingPaused,
    RecordingResumed,
    MetadataDropped,
    CloseFailed,
};

const char* to_string(FrameStoreEventKind kind);

struct FrameStoreEvent {
    FrameStoreEventKind kind;
    std::string message;
};

/// Receives store events, on whichever thread raised them and often with the
/// store lock held: keep it short and never call back into the store.
using EventSink = std::function<void(const FrameStoreEvent&)>;

/// Sink used when none is injected: one line per event on std::cerr.
EventSink stderr_sink();

} // namespace camring
