#include "speech/microphone_transcriber.h"
#include "audio_capture.h"
#include "logger.h"
#include "stt_engine.h"
#include "utils.h"
#include "vad_endpointing.h"
#include <mutex>

namespace voice_os {

class MicrophoneTranscriber::Impl {
public:
    Impl(const SpeechConfig& speech, const VADConfig& vad)
        : speech_(speech), vad_config_(vad), stt_(speech) {}

    Result<std::string> capture_until_stopped(const std::atomic<bool>& stop) {
        std::lock_guard<std::mutex> lock(mutex_);
        AudioCapture capture;
        if (!capture.start(speech_.input_device, speech_.sample_rate)) {
            return make_error(ErrorType::ResourceError, "microphone unavailable");
        }

        LOG_VOICE("Capturing until stopped");
        const size_t limit = max_utterance_samples(vad_config_, speech_.sample_rate);
        AudioBuffer recording;
        AudioFrame frame;
        while (!stop.load()) {
            if (!capture.read_frame(frame)) {
                capture.stop();
                return make_io_error("microphone read failed");
            }
            if (!append_capped(recording, frame, limit)) {
                LOG_VOICE("Recording limit of " + std::to_string(vad_config_.max_utterance_ms) + " ms reached");
                break;
            }
        }
        capture.stop();

        LOG_VOICE("Captured " + std::to_string(recording.size() * 1000 / speech_.sample_rate) + " ms");
        return transcribe(recording);
    }

    Result<std::string> listen_for_utterance(const std::atomic<bool>& running) {
        std::lock_guard<std::mutex> lock(mutex_);
        AudioCapture capture;
        if (!capture.start(speech_.input_device, speech_.sample_rate)) {
            return make_error(ErrorType::ResourceError, "microphone unavailable");
        }

        VADEndpointing vad(vad_config_, speech_.sample_rate);
        AudioFrame frame;
        while (running.load()) {
            if (!capture.read_frame(frame)) {
                capture.stop();
                return make_io_error("microphone read failed");
            }
            if (vad.process(frame) == VADEvent::SpeechEnd) {
                AudioBuffer segment = vad.finalize_segment();
                capture.stop();
                return transcribe(segment);
            }
        }
        capture.stop();
        return std::string();
    }

    bool is_ready() const {
        return stt_.is_ready();
    }

private:
    Result<std::string> transcribe(const AudioBuffer& segment) {
        if (!stt_.is_ready()) {
            return make_error(ErrorType::ResourceError, "speech recognizer not loaded");
        }
        Transcript transcript = stt_.transcribe(segment);
        return utils::trim_copy(transcript.text);
    }

    SpeechConfig speech_;
    VADConfig vad_config_;
    STTEngine stt_;
    std::mutex mutex_;   // one capture at a time
};

MicrophoneTranscriber::MicrophoneTranscriber(const SpeechConfig& speech, const VADConfig& vad)
    : pimpl_(std::make_unique<Impl>(speech, vad)) {}

MicrophoneTranscriber::~MicrophoneTranscriber() = default;

bool MicrophoneTranscriber::is_ready() const {
    return pimpl_->is_ready();
}

Result<std::string> MicrophoneTranscriber::capture_until_stopped(const std::atomic<bool>& stop) {
    return pimpl_->capture_until_stopped(stop);
}

Result<std::string> MicrophoneTranscriber::listen_for_utterance(const std::atomic<bool>& running) {
    return pimpl_->listen_for_utterance(running);
}

} // namespace voice_os
