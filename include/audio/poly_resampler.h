#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace show_ingest::audio {

/**
 * @brief Rational-factor polyphase resampler for int16 mono chunks.
 *
 * up/down are the target and source rates divided by their GCD. The
 * anti-aliasing filter is a Kaiser-windowed sinc (beta 5, half length
 * 10 * max(up, down) taps, cutoff 1 / max(up, down)) scaled by `up`, and
 * only the taps that hit non-zero upsampled inputs are evaluated.
 *
 * Consecutive process() calls form one continuous stream: the last
 * inputs the filter still reaches are kept as history, and the output
 * phase carries over, so a signal split into chunks resamples to exactly
 * the samples the whole signal would. Output lags the input by the filter
 * group delay (halfLength / up input samples). From a fresh state, n
 * inputs yield ceil(n * up / down) outputs. Results are rounded and
 * clipped to the int16 range.
 */
class PolyResampler {
   public:
    PolyResampler(std::uint32_t inputRate, std::uint32_t outputRate);

    std::vector<std::int16_t> process(const std::vector<std::int16_t>& input);

    // Forget history and phase; the next call starts a new stream.
    void reset();

    std::uint32_t inputRate() const {
        return inputRate_;
    }
    std::uint32_t outputRate() const {
        return outputRate_;
    }
    std::uint32_t up() const {
        return up_;
    }
    std::uint32_t down() const {
        return down_;
    }
    bool isPassthrough() const {
        return up_ == 1 && down_ == 1;
    }

    static std::size_t outputLength(std::size_t inputLength, std::uint32_t up, std::uint32_t down);

   private:
    std::uint32_t inputRate_;
    std::uint32_t outputRate_;
    std::uint32_t up_ = 1;
    std::uint32_t down_ = 1;
    std::size_t halfLength_ = 0;
    std::vector<float> taps_;
    // Most recent inputs, oldest first; zeros before the stream starts.
    std::vector<std::int16_t> history_;
    // Upsampled distance from the end of the consumed input to the next output.
    std::uint64_t phase_ = 0;
};

}  // namespace show_ingest::audio
