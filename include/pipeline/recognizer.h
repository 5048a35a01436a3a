#ifndef RECOGNIZER_H
#define RECOGNIZER_H

#include "audio/segment_collector.h"

#include <optional>
#include <string>

namespace Pipeline {

// Speech-to-text boundary. transcribe() is called from the pipeline's recognizer thread,
// one segment at a time, in segment order.
class Recognizer {
   public:
    virtual ~Recognizer() = default;

    // nullopt when recognition failed; an empty string when nothing was said
    virtual std::optional<std::string> transcribe(const VoiceActivity::Segment& segment) = 0;

    virtual std::string name() const = 0;
};

}  // namespace Pipeline

#endif  // RECOGNIZER_H
