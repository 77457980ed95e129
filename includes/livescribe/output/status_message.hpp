#pragma once
#include "livescribe/core/message_queue.hpp"

#include <string>

namespace livescribe {

// Tagged message on the outbound queue read by the host UI.
struct StatusMessage {
    enum class Kind { Status, Error, Warning, Transcription, Finished };

    Kind kind = Kind::Status;
    std::string text;
};

const char* to_string(StatusMessage::Kind kind);

using StatusQueue = MessageQueue<StatusMessage>;
using IntegrationQueue = MessageQueue<std::string>;

inline constexpr std::size_t kIntegrationQueueCapacity = 100;

} // namespace livescribe
