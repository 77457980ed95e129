#pragma once
#include "livescribe/asr/transcription.hpp"
#include "livescribe/core/config.hpp"

#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace livescribe {

using BackendFactory = std::function<std::unique_ptr<TranscriptionBackend>(const BackendParams&)>;
using BackendFactories = std::array<BackendFactory, kModeCount>;

// Process-wide backend clients, one slot per Mode. Created by the host and
// handed to each session; only the session's init phase writes to it.
class BackendRegistry {
public:
    explicit BackendRegistry(BackendFactories factories);

    // On-device: reload only when the model differs from the loaded one.
    // Remote: rebuilt on every call. Returns false (and logs) on failure.
    bool initialize(Mode mode, const BackendParams& params);

    bool is_ready(Mode mode) const;
    const std::string& last_error() const { return last_error_; }

    // Never throws; a missing client is reported as NotInitialized.
    TranscriptionResult transcribe(const SpeechSegment& segment, Mode mode, const TranscribeOptions& options);

private:
    struct Slot {
        std::unique_ptr<TranscriptionBackend> client;
        std::optional<BackendParams> params;
    };

    BackendFactories factories_;
    std::array<Slot, kModeCount> slots_;
    std::string last_error_;
};

} // namespace livescribe
