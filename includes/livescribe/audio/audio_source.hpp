#pragma once
#include "livescribe/audio/audio_frame.hpp"

#include <chrono>
#include <cstddef>
#include <optional>

namespace livescribe {

struct CaptureParams {
    int sample_rate = 16000;
    int channels = 1;                      // frames are down-mixed to mono
    unsigned long frames_per_buffer = 1600; // 100 ms @ 16k
    std::optional<int> device_index;       // if not set, use default input
};

// Producer side of the capture queue. Frames are produced on the device's
// own thread; read() is the consumer's only blocking call.
class AudioSource {
public:
    enum class ReadStatus { Frame, Timeout };

    virtual ~AudioSource() = default;

    // Throws CaptureError if the stream cannot be opened or started.
    virtual void open(const CaptureParams& params) = 0;
    virtual void close() = 0;

    // Waits up to `timeout` for the next frame (FIFO). Throws CaptureError if
    // the stream has died while open.
    virtual ReadStatus read(AudioFrame& out, std::chrono::milliseconds timeout) = 0;

    // Drops frames still queued after close(); returns how many were dropped.
    virtual std::size_t discard_pending() = 0;
};

} // namespace livescribe
