#include "audio/audio_io.h"

#include "logging/logger.h"

#include <cstring>

namespace AudioIO {

// WavReader implementation
WavReader::WavReader() : file_(nullptr) {
    std::memset(&info_, 0, sizeof(info_));
}

WavReader::~WavReader() {
    close();
}

bool WavReader::open(const std::string& filename) {
    close();
    std::memset(&info_, 0, sizeof(info_));
    file_ = sf_open(filename.c_str(), SFM_READ, &info_);
    if (!file_) {
        LOG_ERROR("Error opening input file: {} ({})", filename, sf_strerror(nullptr));
        return false;
    }

    LOG_INFO("Opened: {} ({} Hz, {} ch, {:.2f} s)", filename, info_.samplerate, info_.channels,
             static_cast<double>(info_.frames) / info_.samplerate);
    return true;
}

void WavReader::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

sf_count_t WavReader::readBlock(float* buffer, sf_count_t frames) {
    if (!file_) {
        LOG_ERROR("WavReader: file not opened");
        return -1;
    }
    return sf_readf_float(file_, buffer, frames);
}

// WavWriter implementation
WavWriter::WavWriter() : file_(nullptr) {
    std::memset(&info_, 0, sizeof(info_));
}

WavWriter::~WavWriter() {
    close();
}

bool WavWriter::open(const std::string& filename, int sampleRate, int channels,
                     SampleFormat format) {
    close();
    std::memset(&info_, 0, sizeof(info_));
    info_.samplerate = sampleRate;
    info_.channels = channels;
    info_.format = SF_FORMAT_WAV |
                   (format == SampleFormat::Float32 ? SF_FORMAT_FLOAT : SF_FORMAT_PCM_16);

    file_ = sf_open(filename.c_str(), SFM_WRITE, &info_);
    if (!file_) {
        LOG_ERROR("Error opening output file: {} ({})", filename, sf_strerror(nullptr));
        return false;
    }

    // Clip instead of wrapping when float input exceeds [-1, 1]
    sf_command(file_, SFC_SET_CLIPPING, nullptr, SF_TRUE);

    LOG_DEBUG("Created output file: {} ({} Hz, {} ch)", filename, sampleRate, channels);
    return true;
}

void WavWriter::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

bool WavWriter::writeBlock(const float* buffer, sf_count_t frames) {
    if (!file_) {
        LOG_ERROR("WavWriter: file not opened");
        return false;
    }

    sf_count_t framesWritten = sf_writef_float(file_, buffer, frames);
    return framesWritten == frames;
}

bool writeMonoWav(const std::string& filename, const std::vector<float>& samples, int sampleRate,
                  WavWriter::SampleFormat format) {
    WavWriter writer;
    if (!writer.open(filename, sampleRate, 1, format)) {
        return false;
    }
    const bool ok = writer.writeBlock(samples.data(), static_cast<sf_count_t>(samples.size()));
    writer.close();
    return ok;
}

}  // namespace AudioIO
