#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

struct SpeexPreprocessState_;

namespace show_ingest::audio {

// In-place denoiser for mono int16 frames. Returns false if the frame was
// left untouched.
class NoiseReducer {
   public:
    virtual ~NoiseReducer() = default;

    virtual bool process(std::vector<std::int16_t>& samples, std::uint32_t sampleRate) = 0;
};

class SpeexNoiseReducer : public NoiseReducer {
   public:
    explicit SpeexNoiseReducer(int suppressDb = -25);
    ~SpeexNoiseReducer() override;

    SpeexNoiseReducer(const SpeexNoiseReducer&) = delete;
    SpeexNoiseReducer& operator=(const SpeexNoiseReducer&) = delete;

    bool process(std::vector<std::int16_t>& samples, std::uint32_t sampleRate) override;

   private:
    int suppressDb_;
    SpeexPreprocessState_* state_ = nullptr;
    std::size_t frameSize_ = 0;
    std::uint32_t sampleRate_ = 0;
};

}  // namespace show_ingest::audio
