#pragma once
#include "livescribe/asr/backend_registry.hpp"

namespace livescribe {

// Dispatch table wiring each Mode to its real engine.
BackendFactories default_backend_factories(int whisper_threads = 4);

} // namespace livescribe
