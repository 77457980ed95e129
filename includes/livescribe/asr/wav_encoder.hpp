#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace livescribe {

// Mono 16-bit PCM RIFF/WAVE in memory. Samples are clipped to [-1, 1].
std::string encode_wav_pcm16(const std::vector<float>& samples, int sample_rate);

} // namespace livescribe
