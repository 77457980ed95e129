#include "livescribe/asr/backend_registry.hpp"
#include "livescribe/core/log.hpp"

namespace livescribe {

BackendRegistry::BackendRegistry(BackendFactories factories) : factories_(std::move(factories)) {
}

bool BackendRegistry::initialize(Mode mode, const BackendParams& params) {
    auto& slot = slots_[static_cast<std::size_t>(mode)];
    const auto& factory = factories_[static_cast<std::size_t>(mode)];
    last_error_.clear();

    if (mode == Mode::OnDevice && slot.client && slot.params && slot.params->model == params.model) {
        log::debug("On-device model '" + params.model + "' already loaded");
        return true;
    }
    if (!factory) {
        last_error_ = std::string("no backend available for mode ") + mode_name(mode);
        log::error(last_error_);
        return false;
    }

    slot.client.reset();
    slot.params.reset();
    try {
        slot.client = factory(params);
    } catch (const std::exception& e) {
        last_error_ = e.what();
        log::error(std::string("Backend init failed (") + mode_name(mode) + "): " + last_error_);
        return false;
    }
    if (!slot.client) {
        last_error_ = std::string("backend factory returned nothing for ") + mode_name(mode);
        log::error(last_error_);
        return false;
    }
    slot.params = params;
    log::info(std::string("Backend ready: ") + slot.client->name()
              + (params.model.empty() ? "" : " (" + params.model + ")"));
    return true;
}

bool BackendRegistry::is_ready(Mode mode) const {
    return static_cast<bool>(slots_[static_cast<std::size_t>(mode)].client);
}

TranscriptionResult BackendRegistry::transcribe(const SpeechSegment& segment, Mode mode,
                                                const TranscribeOptions& options) {
    auto& slot = slots_[static_cast<std::size_t>(mode)];
    if (!slot.client) {
        return TranscriptionResult::failure(ErrorKind::NotInitialized, "backend not initialized", mode_name(mode));
    }
    try {
        return slot.client->transcribe(segment, options);
    } catch (const std::exception& e) {
        log::error(std::string(slot.client->name()) + " transcription failed: " + e.what());
        return TranscriptionResult::failure(ErrorKind::Unknown, e.what(), slot.client->name());
    }
}

} // namespace livescribe
