#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct SpeexPreprocessState_;

namespace show_ingest::audio {

/**
 * @brief Binary speech / non-speech decision for one mono int16 frame.
 *
 * Implementations may keep adaptive state across frames but must accept any
 * frame length and rate the processing stage hands them.
 */
class SpeechClassifier {
   public:
    virtual ~SpeechClassifier() = default;

    virtual bool isSpeech(const std::vector<std::int16_t>& samples, std::uint32_t sampleRate) = 0;

    virtual const char* name() const = 0;
};

// Adaptive noise-floor energy gate. Aggressiveness 0..3 raises the margin
// above the tracked floor (6, 9, 12 and 15 dB).
class EnergySpeechClassifier : public SpeechClassifier {
   public:
    explicit EnergySpeechClassifier(int aggressiveness);

    bool isSpeech(const std::vector<std::int16_t>& samples, std::uint32_t sampleRate) override;

    const char* name() const override {
        return "energy";
    }

    float noiseFloor() const {
        return noiseFloorRms_;
    }

   private:
    float marginFactor_;
    float noiseFloorRms_ = 0.001f;
};

// speexdsp preprocessor VAD. The state is rebuilt whenever the frame length
// or rate changes. Aggressiveness maps to the start/continue probabilities.
class SpeexSpeechClassifier : public SpeechClassifier {
   public:
    explicit SpeexSpeechClassifier(int aggressiveness);
    ~SpeexSpeechClassifier() override;

    SpeexSpeechClassifier(const SpeexSpeechClassifier&) = delete;
    SpeexSpeechClassifier& operator=(const SpeexSpeechClassifier&) = delete;

    bool isSpeech(const std::vector<std::int16_t>& samples, std::uint32_t sampleRate) override;

    const char* name() const override {
        return "speex";
    }

   private:
    bool ensureState(std::size_t frameSize, std::uint32_t sampleRate);
    void destroyState();

    int probStart_;
    int probContinue_;
    SpeexPreprocessState_* state_ = nullptr;
    std::size_t frameSize_ = 0;
    std::uint32_t sampleRate_ = 0;
    std::vector<std::int16_t> scratch_;
};

// "speex" or "energy"; throws std::invalid_argument for anything else or an
// aggressiveness outside 0..3.
std::unique_ptr<SpeechClassifier> makeSpeechClassifier(const std::string& backend,
                                                       int aggressiveness);

}  // namespace show_ingest::audio
