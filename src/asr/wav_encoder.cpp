#include "livescribe/asr/wav_encoder.hpp"

#include <algorithm>
#include <cmath>

namespace livescribe {

namespace {
void put_u32(std::string& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

void put_u16(std::string& out, std::uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}
} // namespace

std::string encode_wav_pcm16(const std::vector<float>& samples, int sample_rate) {
    constexpr std::uint16_t kChannels = 1;
    constexpr std::uint16_t kBits = 16;
    const std::uint32_t data_bytes = static_cast<std::uint32_t>(samples.size() * sizeof(std::int16_t));
    const std::uint32_t byte_rate = static_cast<std::uint32_t>(sample_rate) * kChannels * kBits / 8;

    std::string out;
    out.reserve(44 + data_bytes);
    out += "RIFF";
    put_u32(out, 36 + data_bytes);
    out += "WAVE";
    out += "fmt ";
    put_u32(out, 16);
    put_u16(out, 1);  // PCM
    put_u16(out, kChannels);
    put_u32(out, static_cast<std::uint32_t>(sample_rate));
    put_u32(out, byte_rate);
    put_u16(out, kChannels * kBits / 8);
    put_u16(out, kBits);
    out += "data";
    put_u32(out, data_bytes);

    for (float s : samples) {
        const float clipped = std::clamp(s, -1.0f, 1.0f);
        const auto v = static_cast<std::int16_t>(std::lrint(clipped * 32767.0f));
        put_u16(out, static_cast<std::uint16_t>(v));
    }
    return out;
}

} // namespace livescribe
