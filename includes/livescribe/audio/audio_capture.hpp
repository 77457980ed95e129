#pragma once
#include "livescribe/audio/audio_source.hpp"
#include "livescribe/core/message_queue.hpp"

#include <portaudio.h>

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

namespace livescribe {

// PortAudio microphone capture. The callback copies each block (down-mixed to
// mono) into a bounded queue and never blocks; when the queue is full the
// block is dropped and counted.
class PortAudioSource : public AudioSource {
public:
    static constexpr std::size_t kQueueCapacity = 256;

    PortAudioSource();
    ~PortAudioSource() override;
    PortAudioSource(const PortAudioSource&) = delete;
    PortAudioSource& operator=(const PortAudioSource&) = delete;

    static std::vector<std::string> list_input_devices();

    // Safe: initializes PortAudio if needed, fetches a one-line summary, and terminates if it initialized.
    static std::string device_summary(int device_index);

    void open(const CaptureParams& params) override;
    void close() override;
    ReadStatus read(AudioFrame& out, std::chrono::milliseconds timeout) override;
    std::size_t discard_pending() override;

    std::size_t dropped_frames() const { return dropped_.load(); }

private:
    static int pa_callback(const void* input,
                           void* output,
                           unsigned long frame_count,
                           const PaStreamCallbackTimeInfo* time_info,
                           PaStreamCallbackFlags status_flags,
                           void* user_data);

    PaStream* stream_ = nullptr;
    int channels_ = 1;
    MessageQueue<AudioFrame> queue_{kQueueCapacity};
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> dropped_{0};
};

} // namespace livescribe
