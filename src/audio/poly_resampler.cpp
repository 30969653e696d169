#include "audio/poly_resampler.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace show_ingest::audio {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kKaiserBeta = 5.0;
constexpr std::size_t kHalfLengthPerFactor = 10;

// Zeroth-order modified Bessel function of the first kind (power series).
double besselI0(double x) {
    double sum = 1.0;
    double term = 1.0;
    const double halfX = x / 2.0;
    for (int k = 1; k < 64; ++k) {
        term *= (halfX / k) * (halfX / k);
        sum += term;
        if (term < sum * 1e-12) {
            break;
        }
    }
    return sum;
}

std::vector<float> designLowpass(std::size_t halfLength, double cutoff, double gain) {
    const std::size_t numTaps = 2 * halfLength + 1;
    std::vector<double> h(numTaps);
    const double i0Beta = besselI0(kKaiserBeta);
    double sum = 0.0;

    for (std::size_t n = 0; n < numTaps; ++n) {
        const double t = static_cast<double>(n) - static_cast<double>(halfLength);
        const double x = cutoff * t;
        const double sinc = (t == 0.0) ? 1.0 : std::sin(kPi * x) / (kPi * x);
        const double r = (halfLength == 0) ? 0.0 : t / static_cast<double>(halfLength);
        const double window = besselI0(kKaiserBeta * std::sqrt(std::max(0.0, 1.0 - r * r))) / i0Beta;
        h[n] = cutoff * sinc * window;
        sum += h[n];
    }

    // Unity DC gain per phase after zero-stuffing.
    std::vector<float> taps(numTaps);
    for (std::size_t n = 0; n < numTaps; ++n) {
        taps[n] = static_cast<float>(h[n] / sum * gain);
    }
    return taps;
}

}  // namespace

PolyResampler::PolyResampler(std::uint32_t inputRate, std::uint32_t outputRate)
    : inputRate_(inputRate), outputRate_(outputRate) {
    if (inputRate_ == 0 || outputRate_ == 0) {
        throw std::invalid_argument("PolyResampler rates must be positive");
    }
    const std::uint32_t g = std::gcd(inputRate_, outputRate_);
    up_ = outputRate_ / g;
    down_ = inputRate_ / g;
    if (isPassthrough()) {
        return;
    }

    const std::uint32_t maxFactor = std::max(up_, down_);
    halfLength_ = kHalfLengthPerFactor * maxFactor;
    taps_ = designLowpass(halfLength_, 1.0 / static_cast<double>(maxFactor),
                          static_cast<double>(up_));
    // Enough past inputs to cover the whole filter span.
    history_.assign((taps_.size() - 1 + up_ - 1) / up_, 0);
}

void PolyResampler::reset() {
    std::fill(history_.begin(), history_.end(), 0);
    phase_ = 0;
}

std::size_t PolyResampler::outputLength(std::size_t inputLength, std::uint32_t up,
                                        std::uint32_t down) {
    const std::uint64_t num = static_cast<std::uint64_t>(inputLength) * up;
    return static_cast<std::size_t>((num + down - 1) / down);
}

std::vector<std::int16_t> PolyResampler::process(const std::vector<std::int16_t>& input) {
    if (isPassthrough() || input.empty()) {
        return input;
    }

    const std::uint64_t up = up_;
    const std::uint64_t down = down_;
    const std::uint64_t span = static_cast<std::uint64_t>(input.size()) * up;
    const std::size_t outLen =
        span > phase_ ? static_cast<std::size_t>((span - phase_ + down - 1) / down) : 0;

    std::vector<std::int16_t> buffer;
    buffer.reserve(history_.size() + input.size());
    buffer.insert(buffer.end(), history_.begin(), history_.end());
    buffer.insert(buffer.end(), input.begin(), input.end());

    const std::uint64_t lastTap = taps_.size() - 1;
    const std::uint64_t origin = static_cast<std::uint64_t>(history_.size()) * up + phase_;
    std::vector<std::int16_t> output(outLen);

    for (std::size_t k = 0; k < outLen; ++k) {
        // Position in the zero-stuffed buffer; origin >= lastTap keeps every index valid.
        const std::uint64_t m = origin + static_cast<std::uint64_t>(k) * down;
        double acc = 0.0;
        // Only taps landing on real (non-stuffed) samples contribute.
        for (std::uint64_t j = m % up; j <= lastTap; j += up) {
            acc += static_cast<double>(taps_[static_cast<std::size_t>(j)]) *
                   buffer[static_cast<std::size_t>((m - j) / up)];
        }
        const double rounded = std::round(acc);
        output[k] = static_cast<std::int16_t>(std::clamp(rounded, -32768.0, 32767.0));
    }

    phase_ = phase_ + static_cast<std::uint64_t>(outLen) * down - span;
    std::copy(buffer.end() - static_cast<std::ptrdiff_t>(history_.size()), buffer.end(),
              history_.begin());
    return output;
}

}  // namespace show_ingest::audio
