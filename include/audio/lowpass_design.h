#ifndef LOWPASS_DESIGN_H
#define LOWPASS_DESIGN_H

#include <cstddef>
#include <string>
#include <vector>

namespace Resampler {

// Filter quality tier (taps per output sample)
enum class Quality { Fast, Balanced, High };

int tapsForQuality(Quality quality);

const char* qualityToString(Quality quality);

// Case-insensitive. Unknown names fall back to High.
Quality parseQuality(const std::string& name);

// Returns false for names parseQuality() would silently map to High
bool isKnownQuality(const std::string& name);

// Hamming window of the given length (symmetric)
std::vector<double> hammingWindow(size_t length);

// Windowed-sinc low-pass prototype
// taps: kernel length
// cutoff: cutoff frequency as a fraction of the design sample rate (0 < cutoff <= 0.5)
// gain: DC gain; coefficients are scaled so they sum to this value
// Returns an empty vector when taps is 0 or cutoff is out of range.
std::vector<double> designLowpass(size_t taps, double cutoff, double gain = 1.0);

// Split a prototype into `phases` polyphase sub-filters of `tapsPerPhase` each:
// bank[p * tapsPerPhase + j] = prototype[p + j * phases]
std::vector<float> buildPolyphaseBank(const std::vector<double>& prototype, size_t phases,
                                      size_t tapsPerPhase);

}  // namespace Resampler

#endif  // LOWPASS_DESIGN_H
