#ifndef AUDIO_IO_H
#define AUDIO_IO_H

#include <sndfile.h>
#include <string>
#include <vector>

namespace AudioIO {

class WavReader {
   public:
    WavReader();
    ~WavReader();

    WavReader(const WavReader&) = delete;
    WavReader& operator=(const WavReader&) = delete;

    bool open(const std::string& filename);
    void close();

    bool isOpen() const {
        return file_ != nullptr;
    }
    int getSampleRate() const {
        return info_.samplerate;
    }
    int getChannels() const {
        return info_.channels;
    }
    sf_count_t getFrames() const {
        return info_.frames;
    }

    // Read up to `frames` interleaved frames. Returns frames read, 0 at end of file,
    // -1 when the file is not open.
    sf_count_t readBlock(float* buffer, sf_count_t frames);

   private:
    SNDFILE* file_;
    SF_INFO info_;
};

class WavWriter {
   public:
    enum class SampleFormat { Pcm16, Float32 };

    WavWriter();
    ~WavWriter();

    WavWriter(const WavWriter&) = delete;
    WavWriter& operator=(const WavWriter&) = delete;

    bool open(const std::string& filename, int sampleRate, int channels,
              SampleFormat format = SampleFormat::Pcm16);
    void close();

    // Write interleaved frames
    bool writeBlock(const float* buffer, sf_count_t frames);

   private:
    SNDFILE* file_;
    SF_INFO info_;
};

// Write a mono float buffer as a WAV file in one call
bool writeMonoWav(const std::string& filename, const std::vector<float>& samples, int sampleRate,
                  WavWriter::SampleFormat format = WavWriter::SampleFormat::Pcm16);

}  // namespace AudioIO

#endif  // AUDIO_IO_H
