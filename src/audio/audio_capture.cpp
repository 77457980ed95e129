#include "livescribe/audio/audio_capture.hpp"
#include "livescribe/core/errors.hpp"
#include "livescribe/core/log.hpp"

#include <algorithm>
#include <sstream>

namespace livescribe {

PortAudioSource::PortAudioSource() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw CaptureError(std::string("PortAudio init failed: ") + Pa_GetErrorText(err));
    }
}

PortAudioSource::~PortAudioSource() {
    if (stream_) {
        Pa_AbortStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
    Pa_Terminate();
}

std::vector<std::string> PortAudioSource::list_input_devices() {
    std::vector<std::string> out;
    PaError err = Pa_Initialize();
    if (err != paNoError) return out;

    int num = Pa_GetDeviceCount();
    for (int i = 0; i < num; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        if (info->maxInputChannels > 0) {
            const PaHostApiInfo* api = Pa_GetHostApiInfo(info->hostApi);
            std::ostringstream oss;
            oss << "[" << i << "] " << info->name
                << " | API: " << (api ? api->name : "?")
                << ", inCh: " << info->maxInputChannels
                << ", defaultSR: " << info->defaultSampleRate;
            out.push_back(oss.str());
        }
    }
    Pa_Terminate();
    return out;
}

std::string PortAudioSource::device_summary(int device_index) {
    // Ensure PortAudio is initialized for this query.
    bool inited_here = false;
    if (Pa_GetDeviceCount() < 0) { // not initialized
        if (Pa_Initialize() == paNoError) inited_here = true;
    }
    const PaDeviceInfo* info = Pa_GetDeviceInfo(device_index);
    std::ostringstream oss;
    if (!info) {
        oss << "[" << device_index << "] <invalid device index>";
    } else {
        const PaHostApiInfo* api = Pa_GetHostApiInfo(info->hostApi);
        oss << "[" << device_index << "] " << info->name
            << " | API: " << (api ? api->name : "?")
            << ", inCh: " << info->maxInputChannels
            << ", defaultSR: " << info->defaultSampleRate;
    }
    if (inited_here) Pa_Terminate();
    return oss.str();
}

void PortAudioSource::open(const CaptureParams& params) {
    if (stream_) {
        throw CaptureError("Stream already open");
    }

    int device = params.device_index.value_or(Pa_GetDefaultInputDevice());
    if (device == paNoDevice) {
        throw CaptureError("No default input device available");
    }
    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    if (!info || info->maxInputChannels <= 0) {
        throw CaptureError("Device " + std::to_string(device) + " is not an input device");
    }

    channels_ = params.channels;
    PaStreamParameters in_params{};
    in_params.device = device;
    in_params.channelCount = channels_;
    in_params.sampleFormat = paFloat32; // [-1,1], interleaved
    in_params.suggestedLatency = info->defaultLowInputLatency;
    in_params.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_IsFormatSupported(&in_params, nullptr, params.sample_rate);
    if (err != paFormatIsSupported) {
        throw CaptureError(std::string("Unsupported capture format on '") + info->name + "' ("
                           + std::to_string(channels_) + " ch, " + std::to_string(params.sample_rate)
                           + " Hz): " + Pa_GetErrorText(err));
    }

    err = Pa_OpenStream(
        &stream_,
        &in_params,
        nullptr,
        params.sample_rate,
        params.frames_per_buffer,
        paNoFlag,
        &PortAudioSource::pa_callback,
        this);
    if (err != paNoError) {
        stream_ = nullptr;
        throw CaptureError(std::string("Pa_OpenStream failed: ") + Pa_GetErrorText(err));
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        throw CaptureError(std::string("Pa_StartStream failed: ") + Pa_GetErrorText(err));
    }
    running_.store(true);
    log::info("Audio stream started: " + device_summary(device) + ", "
              + std::to_string(params.sample_rate) + " Hz, " + std::to_string(channels_)
              + " ch, block " + std::to_string(params.frames_per_buffer));
}

void PortAudioSource::close() {
    running_.store(false);
    if (stream_) {
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            log::warn(std::string("Pa_StopStream failed: ") + Pa_GetErrorText(err));
        }
        err = Pa_CloseStream(stream_);
        if (err != paNoError) {
            log::warn(std::string("Pa_CloseStream failed: ") + Pa_GetErrorText(err));
        }
        stream_ = nullptr;
        log::info("Audio stream closed");
    }
    if (dropped_.load() > 0) {
        log::warn("Capture queue overflowed, " + std::to_string(dropped_.load()) + " blocks dropped");
    }
}

AudioSource::ReadStatus PortAudioSource::read(AudioFrame& out, std::chrono::milliseconds timeout) {
    if (queue_.pop_for(out, timeout)) {
        return ReadStatus::Frame;
    }
    if (running_.load() && stream_) {
        PaError active = Pa_IsStreamActive(stream_);
        if (active != 1) {
            throw CaptureError(active < 0 ? std::string("Audio stream failed: ") + Pa_GetErrorText(active)
                                          : std::string("Audio stream stopped unexpectedly"));
        }
    }
    return ReadStatus::Timeout;
}

std::size_t PortAudioSource::discard_pending() {
    return queue_.clear();
}

int PortAudioSource::pa_callback(const void* input,
                                 void* /*output*/,
                                 unsigned long frame_count,
                                 const PaStreamCallbackTimeInfo* /*time_info*/,
                                 PaStreamCallbackFlags status_flags,
                                 void* user_data) {
    auto* self = static_cast<PortAudioSource*>(user_data);
    const float* in = static_cast<const float*>(input);
    if (!self || !in) return paContinue;

    AudioFrame frame;
    frame.input_overflow = (status_flags & paInputOverflow) != 0;
    frame.samples.resize(frame_count);
    const int ch = self->channels_;
    if (ch == 1) {
        std::copy(in, in + frame_count, frame.samples.begin());
    } else {
        for (unsigned long i = 0; i < frame_count; ++i) {
            float acc = 0.0f;
            for (int c = 0; c < ch; ++c) acc += in[i * ch + c];
            frame.samples[i] = acc / static_cast<float>(ch);
        }
    }

    if (!self->queue_.push(std::move(frame))) {
        self->dropped_.fetch_add(1);
    }
    return paContinue;
}

} // namespace livescribe
