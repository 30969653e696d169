#include "audio/alsa_capture.h"

#include "logging/logger.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace show_ingest::audio {

namespace {

bool isExplicitPcmName(const std::string& hint) {
    return hint == "default" || hint.rfind("hw:", 0) == 0 || hint.rfind("plughw:", 0) == 0 ||
           hint.rfind("sysdefault", 0) == 0 || hint.rfind("dsnoop", 0) == 0;
}

std::string takeAlsaString(char* raw) {
    if (!raw) {
        return {};
    }
    std::string value(raw);
    std::free(raw);
    return value;
}

// Requested format first, then the capture formats most devices expose.
std::vector<SampleFormat> formatCandidates(SampleFormat requested) {
    std::vector<SampleFormat> candidates{requested};
    for (SampleFormat fallback : {SampleFormat::Int32, SampleFormat::Int16}) {
        if (std::find(candidates.begin(), candidates.end(), fallback) == candidates.end()) {
            candidates.push_back(fallback);
        }
    }
    return candidates;
}

}  // namespace

AlsaCapture::~AlsaCapture() {
    close();
}

snd_pcm_format_t AlsaCapture::toAlsaFormat(SampleFormat format) {
    switch (format) {
    case SampleFormat::Int16:
        return SND_PCM_FORMAT_S16_LE;
    case SampleFormat::Int32:
        return SND_PCM_FORMAT_S32_LE;
    case SampleFormat::Float32:
        return SND_PCM_FORMAT_FLOAT_LE;
    case SampleFormat::Int8:
        return SND_PCM_FORMAT_S8;
    case SampleFormat::UInt8:
        return SND_PCM_FORMAT_U8;
    }
    return SND_PCM_FORMAT_UNKNOWN;
}

std::vector<CaptureCardInfo> AlsaCapture::listCaptureCards() {
    std::vector<CaptureCardInfo> cards;
    int card = -1;
    while (snd_card_next(&card) == 0 && card >= 0) {
        CaptureCardInfo info;
        info.card = card;
        char* name = nullptr;
        if (snd_card_get_name(card, &name) == 0) {
            info.name = takeAlsaString(name);
        }
        char* longName = nullptr;
        if (snd_card_get_longname(card, &longName) == 0) {
            info.longName = takeAlsaString(longName);
        }
        cards.push_back(std::move(info));
    }
    return cards;
}

std::optional<std::string> AlsaCapture::resolveDevice(const std::string& hint) {
    if (isExplicitPcmName(hint)) {
        return hint;
    }
    for (const auto& card : listCaptureCards()) {
        if (card.name.find(hint) != std::string::npos ||
            card.longName.find(hint) != std::string::npos) {
            LOG_DEBUG("[Capture] '{}' matched card {} ({})", hint, card.card, card.name);
            return "hw:" + std::to_string(card.card) + ",0";
        }
    }
    return std::nullopt;
}

std::optional<DeviceError> AlsaCapture::open(const PcmConfig& config, NegotiatedPcm& out) {
    close();
    lastError_.reset();

    auto device = resolveDevice(config.deviceHint);
    if (!device) {
        return DeviceError(ErrorCode::DEVICE_NOT_FOUND,
                           "no capture card matching '" + config.deviceHint + "'");
    }

    int err = snd_pcm_open(&handle_, device->c_str(), SND_PCM_STREAM_CAPTURE, SND_PCM_NONBLOCK);
    if (err < 0) {
        handle_ = nullptr;
        return DeviceError(ErrorCode::DEVICE_OPEN_FAILED,
                           "cannot open " + *device + ": " + snd_strerror(err), err);
    }

    auto fail = [&](ErrorCode code, const std::string& what, int rc) {
        std::string message = "[" + *device + "] " + what + ": " + snd_strerror(rc);
        close();
        return DeviceError(code, message, rc);
    };

    snd_pcm_hw_params_t* hwParams = nullptr;
    snd_pcm_hw_params_alloca(&hwParams);
    snd_pcm_hw_params_any(handle_, hwParams);

    if ((err = snd_pcm_hw_params_set_access(handle_, hwParams, SND_PCM_ACCESS_RW_INTERLEAVED)) <
        0) {
        return fail(ErrorCode::DEVICE_PARAMS_NOT_SUPPORTED, "set_access failed", err);
    }

    // Format: requested, then int32, then int16.
    std::optional<SampleFormat> format;
    for (SampleFormat candidate : formatCandidates(config.format)) {
        if (snd_pcm_hw_params_test_format(handle_, hwParams, toAlsaFormat(candidate)) == 0) {
            format = candidate;
            break;
        }
    }
    if (!format) {
        close();
        return DeviceError(ErrorCode::AUDIO_UNSUPPORTED_FORMAT,
                           "[" + *device + "] no supported capture format");
    }
    if (*format != config.format) {
        LOG_WARN("[Capture] Format {} not supported by {}, falling back to {}",
                 sampleFormatToString(config.format), *device, sampleFormatToString(*format));
    }
    if ((err = snd_pcm_hw_params_set_format(handle_, hwParams, toAlsaFormat(*format))) < 0) {
        return fail(ErrorCode::DEVICE_PARAMS_NOT_SUPPORTED, "set_format failed", err);
    }

    unsigned int channels = config.channels;
    if (snd_pcm_hw_params_test_channels(handle_, hwParams, channels) != 0) {
        LOG_WARN("[Capture] {} channel(s) not supported by {}, using nearest", channels, *device);
    }
    if ((err = snd_pcm_hw_params_set_channels_near(handle_, hwParams, &channels)) < 0) {
        return fail(ErrorCode::DEVICE_PARAMS_NOT_SUPPORTED, "set_channels failed", err);
    }

    // An infeasible rate is not fatal: take the device's nearest rate and
    // let the processing stage resample.
    unsigned int rate = config.sampleRate;
    const bool rateFeasible = snd_pcm_hw_params_test_rate(handle_, hwParams, rate, 0) == 0;
    if ((err = snd_pcm_hw_params_set_rate_near(handle_, hwParams, &rate, nullptr)) < 0) {
        return fail(ErrorCode::AUDIO_INVALID_RATE, "set_rate_near failed", err);
    }
    if (!rateFeasible || rate != config.sampleRate) {
        LOG_WARN("[Capture] Requested rate {} not supported by {}, capturing at {} (resample "
                 "required)",
                 config.sampleRate, *device, rate);
    }

    snd_pcm_uframes_t period = config.periodFrames;
    // Scale the period so one read still spans the configured chunk duration.
    if (rate != config.sampleRate && config.sampleRate > 0) {
        period = static_cast<snd_pcm_uframes_t>(
            (static_cast<std::uint64_t>(config.periodFrames) * rate) / config.sampleRate);
    }
    const snd_pcm_uframes_t wantedPeriod = period;
    if ((err = snd_pcm_hw_params_set_period_size_near(handle_, hwParams, &period, nullptr)) < 0) {
        return fail(ErrorCode::DEVICE_PARAMS_NOT_SUPPORTED, "set_period_size failed", err);
    }
    snd_pcm_uframes_t bufferFrames = std::max<snd_pcm_uframes_t>(period * 4, wantedPeriod * 4);
    if ((err = snd_pcm_hw_params_set_buffer_size_near(handle_, hwParams, &bufferFrames)) < 0) {
        return fail(ErrorCode::DEVICE_PARAMS_NOT_SUPPORTED, "set_buffer_size failed", err);
    }
    if ((err = snd_pcm_hw_params(handle_, hwParams)) < 0) {
        return fail(ErrorCode::DEVICE_PARAMS_NOT_SUPPORTED, "apply hw_params failed", err);
    }
    if ((err = snd_pcm_prepare(handle_)) < 0) {
        return fail(ErrorCode::DEVICE_OPEN_FAILED, "prepare failed", err);
    }
    if ((err = snd_pcm_start(handle_)) < 0) {
        return fail(ErrorCode::DEVICE_OPEN_FAILED, "start failed", err);
    }

    negotiated_.deviceName = *device;
    negotiated_.sampleRate = rate;
    negotiated_.channels = channels;
    negotiated_.format = *format;
    // Hand out chunks of the wanted size even if the hardware period differs.
    negotiated_.periodFrames = static_cast<std::uint32_t>(wantedPeriod);
    negotiated_.resampleRequired = (rate != config.sampleRate);

    frameBytes_ = bytesPerSample(*format) * channels;
    pending_.assign(static_cast<std::size_t>(negotiated_.periodFrames) * frameBytes_, 0);
    pendingFrames_ = 0;

    LOG_INFO("[Capture] Opened {} rate={} ch={} fmt={} period={} hwPeriod={} buffer={}", *device,
             rate, channels, sampleFormatToString(*format), negotiated_.periodFrames, period,
             bufferFrames);
    out = negotiated_;
    return std::nullopt;
}

void AlsaCapture::close() {
    if (handle_) {
        snd_pcm_drop(handle_);
        snd_pcm_close(handle_);
        handle_ = nullptr;
        LOG_DEBUG("[Capture] Closed {}", negotiated_.deviceName);
    }
    pendingFrames_ = 0;
}

device::ReadStatus AlsaCapture::failHard(ErrorCode code, const std::string& what, int err) {
    lastError_ = DeviceError(code, what + ": " + snd_strerror(err), err);
    return device::ReadStatus::HardError;
}

device::ReadStatus AlsaCapture::read(std::vector<std::uint8_t>& out,
                                     std::chrono::milliseconds timeout) {
    if (!handle_) {
        lastError_ = DeviceError(ErrorCode::DEVICE_DISCONNECTED, "read on closed device");
        return device::ReadStatus::HardError;
    }

    int ready = snd_pcm_wait(handle_, static_cast<int>(timeout.count()));
    if (ready == 0) {
        return device::ReadStatus::Idle;
    }
    if (ready < 0 && ready != -EPIPE && ready != -ESTRPIPE) {
        return failHard(ErrorCode::DEVICE_IO_ERROR, "snd_pcm_wait failed", ready);
    }

    const std::size_t wanted = negotiated_.periodFrames - pendingFrames_;
    snd_pcm_sframes_t frames = (ready < 0)
                                   ? ready
                                   : snd_pcm_readi(handle_, pending_.data() + pendingFrames_ * frameBytes_,
                                                   wanted);
    if (frames == -EAGAIN) {
        return device::ReadStatus::Idle;
    }
    if (frames == -EPIPE) {
        // Overrun: the partial chunk is discarded along with the lost samples.
        pendingFrames_ = 0;
        int rc = snd_pcm_prepare(handle_);
        if (rc < 0) {
            return failHard(ErrorCode::DEVICE_IO_ERROR, "prepare after xrun failed", rc);
        }
        snd_pcm_start(handle_);
        return device::ReadStatus::Xrun;
    }
    if (frames < 0) {
        int rc = snd_pcm_recover(handle_, static_cast<int>(frames), 1);
        if (rc < 0) {
            ErrorCode code = (frames == -ENODEV || frames == -EBADFD) ? ErrorCode::DEVICE_DISCONNECTED
                                                                       : ErrorCode::DEVICE_IO_ERROR;
            return failHard(code, "snd_pcm_readi failed", static_cast<int>(frames));
        }
        pendingFrames_ = 0;
        return device::ReadStatus::Xrun;
    }

    pendingFrames_ += static_cast<std::size_t>(frames);
    if (pendingFrames_ < negotiated_.periodFrames) {
        return device::ReadStatus::Idle;
    }
    out.assign(pending_.begin(), pending_.begin() + negotiated_.periodFrames * frameBytes_);
    pendingFrames_ = 0;
    return device::ReadStatus::Data;
}

}  // namespace show_ingest::audio
