#pragma once

#include "error.hpp"

// Microphone stream. Samples go to the SampleRing the implementation was
// constructed with; start() while already capturing is a no-op.
class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    virtual Result<void> start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
};
