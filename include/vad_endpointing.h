#pragma once

#include "common.h"
#include "config.h"
#include <memory>

namespace voice_os {

enum class VADEvent {
    None,
    SpeechStart,
    SpeechEnd
};

/// Samples in max_utterance_ms at the given rate
size_t max_utterance_samples(const VADConfig& config, int sample_rate);

/**
 * @brief Append a frame without letting the recording grow past limit samples
 * @return false once the recording is full (the frame is truncated or dropped)
 */
bool append_capped(AudioBuffer& recording, const AudioFrame& frame, size_t limit);

/**
 * @brief Energy-based utterance endpointing
 *
 * Tracks an adaptive noise floor and cuts one utterance per SpeechStart /
 * SpeechEnd pair. Bursts shorter than min_speech_ms are dropped silently;
 * utterances are force-ended at max_utterance_ms.
 */
class VADEndpointing {
public:
    explicit VADEndpointing(const VADConfig& config, int sample_rate = DEFAULT_SAMPLE_RATE);
    ~VADEndpointing();

    // Process a frame and return events
    VADEvent process(const AudioFrame& frame);

    // Finalize and return segment (on SpeechEnd)
    AudioBuffer finalize_segment();

    bool in_speech() const;

    // Reset state
    void reset();

    /// RMS of a frame, normalized to 0..1
    static float compute_energy(const AudioFrame& frame);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voice_os
