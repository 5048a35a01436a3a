#include "audio/alsa_capture.h"

#include "audio/audio_utils.h"
#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace AudioCapture {

AlsaCapture::AlsaCapture() = default;

AlsaCapture::~AlsaCapture() {
    close();
}

bool AlsaCapture::open(const Config& config) {
    close();

    config_ = config;

    auto fail = [&](const char* message, int err) {
        LOG_ERROR("[AlsaCapture] {}: {}", message, snd_strerror(err));
        close();
        return false;
    };

    int rc = snd_pcm_open(&handle_, config_.deviceName.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (rc < 0) {
        LOG_ERROR("[AlsaCapture] snd_pcm_open({}) failed: {}", config_.deviceName,
                  snd_strerror(rc));
        handle_ = nullptr;
        return false;
    }

    snd_pcm_hw_params_t* hwParams = nullptr;
    snd_pcm_hw_params_alloca(&hwParams);
    snd_pcm_hw_params_any(handle_, hwParams);

    rc = snd_pcm_hw_params_set_access(handle_, hwParams, SND_PCM_ACCESS_RW_INTERLEAVED);
    if (rc < 0) {
        return fail("set_access failed", rc);
    }

    auto selectedFormat = selectSupportedFormat(config_.format, [&](SampleFormat fmt) {
        return snd_pcm_hw_params_test_format(handle_, hwParams, toAlsaFormat(fmt)) == 0;
    });
    if (!selectedFormat) {
        LOG_ERROR("[AlsaCapture] No supported PCM format found for device");
        close();
        return false;
    }
    if (*selectedFormat != config_.format) {
        LOG_INFO("[AlsaCapture] Requested format {} not supported, falling back to {}",
                 snd_pcm_format_name(toAlsaFormat(config_.format)),
                 snd_pcm_format_name(toAlsaFormat(*selectedFormat)));
        config_.format = *selectedFormat;
    }

    const snd_pcm_format_t alsaFormat = toAlsaFormat(config_.format);
    rc = snd_pcm_hw_params_set_format(handle_, hwParams, alsaFormat);
    if (rc < 0) {
        return fail("set_format failed", rc);
    }

    rc = snd_pcm_hw_params_set_channels(handle_, hwParams, config_.channels);
    if (rc < 0) {
        return fail("set_channels failed", rc);
    }

    unsigned int rate = config_.sampleRate;
    rc = snd_pcm_hw_params_set_rate_near(handle_, hwParams, &rate, nullptr);
    if (rc < 0) {
        return fail("set_rate_near failed", rc);
    }
    if (rate != config_.sampleRate) {
        // The resampler is configured from the negotiated rate, so this is not fatal
        LOG_WARN("[AlsaCapture] Requested rate {} not available, device runs at {}",
                 config_.sampleRate, rate);
        config_.sampleRate = rate;
    }

    snd_pcm_uframes_t period = config_.periodFrames;
    rc = snd_pcm_hw_params_set_period_size_near(handle_, hwParams, &period, nullptr);
    if (rc < 0) {
        return fail("set_period_size failed", rc);
    }
    config_.periodFrames = period;

    rc = snd_pcm_hw_params(handle_, hwParams);
    if (rc < 0) {
        return fail("apply hw_params failed", rc);
    }

    frameBytes_ = bytesPerFrame(config_);

    LOG_INFO("[AlsaCapture] opened device={} rate={} ch={} fmt={} period_frames={}",
             config_.deviceName, config_.sampleRate, config_.channels,
             snd_pcm_format_name(alsaFormat), period);
    return true;
}

bool AlsaCapture::start() {
    if (!handle_) {
        LOG_WARN("[AlsaCapture] start requested without open");
        return false;
    }
    int rc = snd_pcm_prepare(handle_);
    if (rc < 0) {
        LOG_ERROR("[AlsaCapture] snd_pcm_prepare failed: {}", snd_strerror(rc));
        return false;
    }
    rc = snd_pcm_start(handle_);
    if (rc < 0) {
        LOG_ERROR("[AlsaCapture] snd_pcm_start failed: {}", snd_strerror(rc));
        return false;
    }
    return true;
}

int AlsaCapture::readFloat(std::vector<float>& interleaved) {
    if (!handle_) {
        LOG_ONCE(WARN, "[AlsaCapture] read called before open");
        return -1;
    }

    const std::size_t bytesPerPeriod = static_cast<std::size_t>(config_.periodFrames) * frameBytes_;
    if (raw_.size() < bytesPerPeriod) {
        raw_.resize(bytesPerPeriod);
    }

    const snd_pcm_sframes_t frames = snd_pcm_readi(handle_, raw_.data(), config_.periodFrames);
    if (frames == -EPIPE) {
        LOG_EVERY_N(WARN, 50, "[AlsaCapture] XRUN detected, recovering...");
        int rc = snd_pcm_prepare(handle_);
        if (rc < 0) {
            LOG_ERROR("[AlsaCapture] snd_pcm_prepare failed after XRUN: {}", snd_strerror(rc));
            return -1;
        }
        return -EPIPE;
    }
    if (frames == -EAGAIN) {
        return 0;
    }
    if (frames < 0) {
        LOG_ERROR("[AlsaCapture] snd_pcm_readi failed: {}", snd_strerror(static_cast<int>(frames)));
        return static_cast<int>(frames);
    }

    convertToFloat(raw_.data(), static_cast<std::size_t>(frames), config_, interleaved);
    return static_cast<int>(frames);
}

void AlsaCapture::stop() {
    if (handle_) {
        snd_pcm_drop(handle_);
        LOG_INFO("[AlsaCapture] stopped");
    }
}

void AlsaCapture::close() {
    if (handle_) {
        snd_pcm_close(handle_);
        handle_ = nullptr;
        LOG_INFO("[AlsaCapture] closed");
    }
}

bool AlsaCapture::isOpen() const {
    return handle_ != nullptr;
}

std::optional<unsigned int> AlsaCapture::currentSampleRate() const {
    if (!handle_) {
        return std::nullopt;
    }
    snd_pcm_hw_params_t* params = nullptr;
    snd_pcm_hw_params_alloca(&params);
    if (snd_pcm_hw_params_current(handle_, params) < 0) {
        return std::nullopt;
    }
    unsigned int rate = 0;
    if (snd_pcm_hw_params_get_rate(params, &rate, nullptr) < 0) {
        return std::nullopt;
    }
    return rate;
}

snd_pcm_format_t AlsaCapture::toAlsaFormat(SampleFormat format) {
    switch (format) {
    case SampleFormat::S16_LE:
        return SND_PCM_FORMAT_S16_LE;
    case SampleFormat::S24_3LE:
        return SND_PCM_FORMAT_S24_3LE;
    case SampleFormat::S32_LE:
        return SND_PCM_FORMAT_S32_LE;
    }
    return SND_PCM_FORMAT_UNKNOWN;
}

std::optional<AlsaCapture::SampleFormat> AlsaCapture::fromAlsaFormat(snd_pcm_format_t format) {
    switch (format) {
    case SND_PCM_FORMAT_S16_LE:
        return SampleFormat::S16_LE;
    case SND_PCM_FORMAT_S24_3LE:
        return SampleFormat::S24_3LE;
    case SND_PCM_FORMAT_S32_LE:
        return SampleFormat::S32_LE;
    default:
        return std::nullopt;
    }
}

std::optional<AlsaCapture::SampleFormat> AlsaCapture::parseFormat(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "S16_LE") {
        return SampleFormat::S16_LE;
    }
    if (upper == "S24_3LE") {
        return SampleFormat::S24_3LE;
    }
    if (upper == "S32_LE") {
        return SampleFormat::S32_LE;
    }
    return std::nullopt;
}

std::size_t AlsaCapture::bytesPerFrame(const Config& config) {
    switch (config.format) {
    case SampleFormat::S16_LE:
        return static_cast<std::size_t>(config.channels) * 2U;
    case SampleFormat::S24_3LE:
        return static_cast<std::size_t>(config.channels) * 3U;
    case SampleFormat::S32_LE:
        return static_cast<std::size_t>(config.channels) * 4U;
    }
    return 0;
}

std::optional<AlsaCapture::SampleFormat> AlsaCapture::selectSupportedFormat(
    SampleFormat requested, const std::function<bool(SampleFormat)>& isSupported) {
    std::vector<SampleFormat> candidates;
    candidates.push_back(requested);
    // Speech needs no more than 16 bits; prefer the cheapest format after the requested one
    for (auto fmt : {SampleFormat::S16_LE, SampleFormat::S32_LE, SampleFormat::S24_3LE}) {
        if (std::find(candidates.begin(), candidates.end(), fmt) == candidates.end()) {
            candidates.push_back(fmt);
        }
    }

    for (auto fmt : candidates) {
        if (isSupported(fmt)) {
            return fmt;
        }
    }
    return std::nullopt;
}

void AlsaCapture::convertToFloat(const std::uint8_t* raw, std::size_t frames, const Config& config,
                                 std::vector<float>& out) {
    const std::size_t samples = frames * config.channels;
    out.resize(samples);
    switch (config.format) {
    case SampleFormat::S16_LE: {
        std::vector<int16_t> pcm(samples);
        std::memcpy(pcm.data(), raw, samples * sizeof(int16_t));
        AudioUtils::int16ToFloat(pcm.data(), out.data(), samples);
        break;
    }
    case SampleFormat::S24_3LE:
        AudioUtils::int24PackedToFloat(raw, out.data(), samples);
        break;
    case SampleFormat::S32_LE: {
        std::vector<int32_t> pcm(samples);
        std::memcpy(pcm.data(), raw, samples * sizeof(int32_t));
        AudioUtils::int32ToFloat(pcm.data(), out.data(), samples);
        break;
    }
    }
}

}  // namespace AudioCapture
