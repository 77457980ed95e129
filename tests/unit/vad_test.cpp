#undef NDEBUG
#include <cassert>
#include <memory>
#include <vector>
#include "livescribe/core/errors.hpp"
#include "livescribe/vad/voice_activity_detector.hpp"
#include "test_fakes.hpp"

using namespace livescribe;
using livescribe::testing::AmplitudeClassifier;
using livescribe::testing::silence;
using livescribe::testing::tone;
using Status = VoiceActivityDetector::Status;

namespace {

VoiceActivityDetector::Config base_config() {
    VoiceActivityDetector::Config c;
    c.threshold = 0.5f;
    c.min_speech_ms = 200;
    c.min_silence_ms = 500;
    c.sample_rate = 16000;
    c.adaptive_threshold = false;
    c.padding = false;
    return c;
}

std::unique_ptr<VoiceActivityDetector> make_vad(const VoiceActivityDetector::Config& c) {
    return std::make_unique<VoiceActivityDetector>(c, std::make_unique<AmplitudeClassifier>());
}

bool balanced(const VoiceActivityDetector& vad) {
    const auto& s = vad.stats();
    return s.fed == s.emitted + s.discarded + vad.buffered_samples();
}

std::vector<float> concat(std::initializer_list<std::vector<float>> parts) {
    std::vector<float> out;
    for (const auto& p : parts) out.insert(out.end(), p.begin(), p.end());
    return out;
}

} // namespace

int main() {
    // Window sizes and frame counts (rounded up)
    {
        auto vad = make_vad(base_config());
        assert(vad->window_size() == 512);
        assert(vad->min_speech_frames() == 7);
        assert(vad->min_silence_frames() == 16);

        auto c = base_config();
        c.sample_rate = 8000;
        auto narrow = make_vad(c);
        assert(narrow->window_size() == 256);
        assert(narrow->min_speech_frames() == 7);
    }

    {
        auto c = base_config();
        c.sample_rate = 44100;
        bool threw = false;
        try {
            make_vad(c);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    // Six speech windows never trigger
    {
        auto vad = make_vad(base_config());
        for (int i = 0; i < 6; ++i) assert(vad->process_chunk(tone(512)).status == Status::Processing);
        for (int i = 0; i < 20; ++i) assert(vad->process_chunk(silence(512)).status == Status::Processing);
        assert(!vad->triggered());
        assert(vad->stats().emitted == 0);
        assert(balanced(*vad));
    }

    // Seven speech windows trigger; the sixteenth silent window closes
    {
        auto vad = make_vad(base_config());
        for (int i = 0; i < 7; ++i) vad->process_chunk(tone(512));
        assert(vad->triggered());
        for (int i = 1; i <= 16; ++i) {
            auto r = vad->process_chunk(silence(512));
            if (i < 16) {
                assert(r.status == Status::Processing && !r.segment);
            } else {
                assert(r.status == Status::SpeechEnded);
                // onset windows + three trailing silence windows
                assert(r.segment && r.segment->samples.size() == 10 * 512);
            }
        }
        assert(!vad->triggered());
        assert(vad->stats().fed == 23 * 512);
        assert(vad->stats().emitted == 10 * 512);
        assert(vad->stats().discarded == 13 * 512);
        assert(balanced(*vad));
    }

    // Chunks that do not align with windows lose nothing
    {
        auto vad = make_vad(base_config());
        auto audio = concat({tone(8000), silence(12000), tone(1000), silence(3000)});
        int ended = 0;
        for (std::size_t off = 0; off < audio.size(); off += 1600) {
            std::size_t n = std::min<std::size_t>(1600, audio.size() - off);
            if (vad->process_chunk(audio.data() + off, n).status == Status::SpeechEnded) ++ended;
            assert(balanced(*vad));
        }
        assert(ended == 1);
    }

    // Segments under 200 ms are dropped
    {
        auto c = base_config();
        c.min_speech_ms = 32;
        c.min_silence_ms = 64;
        auto vad = make_vad(c);
        vad->process_chunk(tone(512));
        assert(vad->triggered());
        auto r1 = vad->process_chunk(silence(512));
        auto r2 = vad->process_chunk(silence(512));
        assert(r1.status == Status::Processing && r2.status == Status::Processing);
        assert(!r2.segment);
        assert(!vad->triggered());
        assert(balanced(*vad));
    }

    // Padding adds silence on both sides but is not counted as emitted
    {
        auto c = base_config();
        c.padding = true;
        c.padding_ms = 200;
        auto vad = make_vad(c);
        auto r = vad->process_chunk(concat({tone(7 * 512), silence(16 * 512)}));
        assert(r.status == Status::SpeechEnded);
        assert(r.segment->samples.size() == 10 * 512 + 2 * 3200);
        assert(r.segment->samples.front() == 0.0f && r.segment->samples.back() == 0.0f);
        assert(vad->stats().emitted == 10 * 512);
        assert(balanced(*vad));
    }

    // A failed window is skipped; SPEECH_ENDED wins over ERROR in the same call
    {
        auto vad = make_vad(base_config());
        std::vector<float> bad(512, 0.0f);
        bad[0] = 2.0f;
        auto r = vad->process_chunk(bad);
        assert(r.status == Status::Error);
        assert(vad->stats().failed_windows == 1);
        assert(vad->process_chunk(silence(512)).status == Status::Processing);

        vad->process_chunk(tone(7 * 512));
        vad->process_chunk(silence(15 * 512));
        r = vad->process_chunk(concat({bad, silence(512)}));
        assert(r.status == Status::SpeechEnded);
        assert(vad->stats().failed_windows == 2);
        assert(balanced(*vad));
    }

    // Two utterances in one chunk come out on consecutive calls
    {
        auto vad = make_vad(base_config());
        auto audio = concat({tone(7 * 512), silence(16 * 512), tone(8 * 512), silence(16 * 512)});
        auto r = vad->process_chunk(audio);
        assert(r.status == Status::SpeechEnded);
        assert(vad->buffered_samples() == 24 * 512);
        r = vad->process_chunk(nullptr, 0);
        assert(r.status == Status::SpeechEnded);
        assert(r.segment->samples.size() == 11 * 512);
        assert(balanced(*vad));
    }

    // flush() closes the open segment once
    {
        auto vad = make_vad(base_config());
        vad->process_chunk(tone(10 * 512));
        auto segs = vad->flush();
        assert(segs.size() == 1 && segs[0].samples.size() == 10 * 512);
        assert(vad->flush().empty());
    }

    // flush() also runs windows left pending behind an earlier segment
    {
        auto vad = make_vad(base_config());
        auto audio = concat({tone(7 * 512), silence(16 * 512), tone(8 * 512), silence(16 * 512), tone(9 * 512 + 100)});
        auto r = vad->process_chunk(audio);
        assert(r.status == Status::SpeechEnded);
        assert(r.segment->samples.size() == 10 * 512);

        auto segs = vad->flush();
        assert(segs.size() == 2);
        assert(segs[0].samples.size() == 11 * 512);
        assert(segs[1].samples.size() == 9 * 512);
        assert(vad->buffered_samples() == 0);
        assert(balanced(*vad));
        assert(vad->flush().empty());
    }

    // reset() twice is the same as once
    {
        auto vad = make_vad(base_config());
        vad->process_chunk(tone(9 * 512 + 100));
        vad->reset();
        assert(vad->buffered_samples() == 0 && !vad->triggered() && vad->stats().fed == 0);
        vad->reset();
        assert(vad->buffered_samples() == 0 && !vad->triggered() && vad->stats().fed == 0);
        assert(vad->threshold() == 0.5f);
    }
    return 0;
}
