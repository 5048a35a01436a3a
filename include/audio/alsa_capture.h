#pragma once

#include <alsa/asoundlib.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace AudioCapture {

class AlsaCapture {
   public:
    enum class SampleFormat {
        S16_LE,
        S24_3LE,
        S32_LE,
    };

    struct Config {
        std::string deviceName{"default"};
        unsigned int sampleRate{44100};
        unsigned int channels{1};
        SampleFormat format{SampleFormat::S16_LE};
        snd_pcm_uframes_t periodFrames{1024};
    };

    AlsaCapture();
    ~AlsaCapture();

    AlsaCapture(const AlsaCapture&) = delete;
    AlsaCapture& operator=(const AlsaCapture&) = delete;

    bool open(const Config& config);
    bool start();
    /**
     * Read one period as interleaved float samples.
     * Returns frames read, 0 when nothing was available, -EPIPE after a recovered
     * overrun, other negative values on error.
     */
    int readFloat(std::vector<float>& interleaved);
    void stop();
    void close();

    bool isOpen() const;
    // Negotiated values; may differ from the requested Config
    const Config& activeConfig() const {
        return config_;
    }
    std::optional<unsigned int> currentSampleRate() const;

    // Exposed for unit tests and CLI validation
    static snd_pcm_format_t toAlsaFormat(SampleFormat format);
    static std::optional<SampleFormat> fromAlsaFormat(snd_pcm_format_t format);
    static std::optional<SampleFormat> parseFormat(const std::string& name);
    static std::size_t bytesPerFrame(const Config& config);
    static std::optional<SampleFormat> selectSupportedFormat(
        SampleFormat requested, const std::function<bool(SampleFormat)>& isSupported);
    // Raw PCM bytes of `frames` frames -> interleaved floats
    static void convertToFloat(const std::uint8_t* raw, std::size_t frames, const Config& config,
                               std::vector<float>& out);

   private:
    Config config_{};
    snd_pcm_t* handle_{nullptr};
    std::size_t frameBytes_{0};
    std::vector<std::uint8_t> raw_;
};

}  // namespace AudioCapture
