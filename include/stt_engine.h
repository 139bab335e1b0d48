#pragma once

#include "common.h"
#include "config.h"
#include <string>
#include <memory>

namespace voice_os {

/**
 * @brief whisper.cpp transcription of captured utterances
 */
class STTEngine {
public:
    explicit STTEngine(const SpeechConfig& config);
    ~STTEngine();

    // Non-copyable
    STTEngine(const STTEngine&) = delete;
    STTEngine& operator=(const STTEngine&) = delete;

    // Transcribe audio segment (16 kHz mono)
    Transcript transcribe(const AudioBuffer& segment);

    // Check if engine is ready
    bool is_ready() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voice_os
