#pragma once

#include "config.h"
#include "speech/speech_input.h"
#include <memory>

namespace voice_os {

/**
 * @brief SpeechInput over the microphone, energy endpointing and whisper
 *
 * The microphone is opened per capture and closed afterwards so that the
 * assistant's own speech is not recorded between commands.
 */
class MicrophoneTranscriber : public SpeechInput {
public:
    MicrophoneTranscriber(const SpeechConfig& speech, const VADConfig& vad);
    ~MicrophoneTranscriber() override;

    // Non-copyable
    MicrophoneTranscriber(const MicrophoneTranscriber&) = delete;
    MicrophoneTranscriber& operator=(const MicrophoneTranscriber&) = delete;

    /// False when the whisper model could not be loaded
    bool is_ready() const;

    Result<std::string> capture_until_stopped(const std::atomic<bool>& stop) override;
    Result<std::string> listen_for_utterance(const std::atomic<bool>& running) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voice_os
