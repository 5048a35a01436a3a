#include "audio/lowpass_design.h"

#include "core/dictation_constants.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace Resampler {

namespace {

constexpr double kPi = 3.14159265358979323846;

std::string toLower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

double sinc(double x) {
    if (std::fabs(x) < 1e-12) {
        return 1.0;
    }
    return std::sin(kPi * x) / (kPi * x);
}

}  // namespace

int tapsForQuality(Quality quality) {
    switch (quality) {
    case Quality::Fast:
        return DictationConstants::FAST_FILTER_TAPS;
    case Quality::Balanced:
        return DictationConstants::BALANCED_FILTER_TAPS;
    case Quality::High:
    default:
        return DictationConstants::HIGH_FILTER_TAPS;
    }
}

const char* qualityToString(Quality quality) {
    switch (quality) {
    case Quality::Fast:
        return "fast";
    case Quality::Balanced:
        return "balanced";
    case Quality::High:
    default:
        return "high";
    }
}

Quality parseQuality(const std::string& name) {
    const std::string lower = toLower(name);
    if (lower == "fast") {
        return Quality::Fast;
    }
    if (lower == "balanced") {
        return Quality::Balanced;
    }
    return Quality::High;
}

bool isKnownQuality(const std::string& name) {
    const std::string lower = toLower(name);
    return lower == "fast" || lower == "balanced" || lower == "high";
}

std::vector<double> hammingWindow(size_t length) {
    std::vector<double> window(length, 1.0);
    if (length <= 1) {
        return window;
    }
    const double denom = static_cast<double>(length - 1);
    for (size_t n = 0; n < length; ++n) {
        window[n] = 0.54 - 0.46 * std::cos(2.0 * kPi * static_cast<double>(n) / denom);
    }
    return window;
}

std::vector<double> designLowpass(size_t taps, double cutoff, double gain) {
    if (taps == 0 || !(cutoff > 0.0) || cutoff > 0.5) {
        return {};
    }

    const std::vector<double> window = hammingWindow(taps);
    const double center = static_cast<double>(taps - 1) / 2.0;

    std::vector<double> h(taps);
    double sum = 0.0;
    for (size_t n = 0; n < taps; ++n) {
        const double t = static_cast<double>(n) - center;
        h[n] = 2.0 * cutoff * sinc(2.0 * cutoff * t) * window[n];
        sum += h[n];
    }

    // Normalize DC gain
    if (std::fabs(sum) > 1e-12) {
        const double scale = gain / sum;
        for (double& coeff : h) {
            coeff *= scale;
        }
    }
    return h;
}

std::vector<float> buildPolyphaseBank(const std::vector<double>& prototype, size_t phases,
                                      size_t tapsPerPhase) {
    std::vector<float> bank(phases * tapsPerPhase, 0.0f);
    for (size_t p = 0; p < phases; ++p) {
        for (size_t j = 0; j < tapsPerPhase; ++j) {
            const size_t k = p + j * phases;
            if (k < prototype.size()) {
                bank[p * tapsPerPhase + j] = static_cast<float>(prototype[k]);
            }
        }
    }
    return bank;
}

}  // namespace Resampler
