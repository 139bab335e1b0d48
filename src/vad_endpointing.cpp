#include "vad_endpointing.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <sstream>

namespace voice_os {

class VADEndpointing::Impl {
public:
    Impl(const VADConfig& config, int sample_rate)
        : config_(config),
          sample_rate_(sample_rate > 0 ? sample_rate : DEFAULT_SAMPLE_RATE),
          state_(VADState::Silence),
          noise_floor_(config.threshold * 0.3f),
          noise_floor_initialized_(false) {
        min_speech_samples_ = (static_cast<int64_t>(config.min_speech_ms) * sample_rate_) / 1000;
        end_silence_samples_ = (static_cast<int64_t>(config.end_silence_ms) * sample_rate_) / 1000;
        max_utterance_samples_ = static_cast<int64_t>(max_utterance_samples(config, sample_rate_));
        start_threshold_ = config_.threshold;
        end_threshold_ = config_.threshold * 0.5f;
    }

    VADEvent process(const AudioFrame& frame) {
        float rms = compute_energy(frame);
        update_noise_floor(rms);
        float effective_start = std::max(start_threshold_, noise_floor_ * 2.0f + 0.02f);
        float effective_end = std::max(end_threshold_, noise_floor_ * 1.3f + 0.01f);
        bool above_start = rms > effective_start;
        bool above_end = rms > effective_end;

        switch (state_) {
            case VADState::Silence:
                // Debounce: require 2 consecutive hot frames before SpeechStart
                if (!above_start) {
                    consecutive_speech_frames_ = 0;
                    return VADEvent::None;
                }
                if (++consecutive_speech_frames_ < START_FRAMES_REQUIRED) {
                    return VADEvent::None;
                }
                state_ = VADState::Speech;
                consecutive_speech_frames_ = 0;
                speech_samples_ = static_cast<int64_t>(frame.size());
                silence_samples_ = 0;
                current_segment_.assign(frame.begin(), frame.end());
                {
                    std::ostringstream oss;
                    oss << "[VAD] SpeechStart rms=" << rms << " threshold=" << effective_start;
                    LOG_AUDIO(oss.str());
                }
                return VADEvent::SpeechStart;

            case VADState::Speech:
                current_segment_.insert(current_segment_.end(), frame.begin(), frame.end());
                if (above_end) {
                    speech_samples_ += static_cast<int64_t>(frame.size());
                    silence_samples_ = 0;
                } else {
                    silence_samples_ += static_cast<int64_t>(frame.size());
                }

                if (static_cast<int64_t>(current_segment_.size()) >= max_utterance_samples_) {
                    LOG_AUDIO("[VAD] Max utterance length reached");
                    return end_speech();
                }
                if (silence_samples_ >= end_silence_samples_) {
                    if (speech_samples_ < min_speech_samples_) {
                        LOG_AUDIO("[VAD] Discarding short burst (" +
                                  std::to_string(speech_samples_ * 1000 / sample_rate_) + " ms)");
                        reset();
                        return VADEvent::None;
                    }
                    return end_speech();
                }
                return VADEvent::None;
        }
        return VADEvent::None;
    }

    AudioBuffer finalize_segment() {
        AudioBuffer result;
        result.swap(current_segment_);
        return result;
    }

    bool in_speech() const {
        return state_ == VADState::Speech;
    }

    void reset() {
        state_ = VADState::Silence;
        speech_samples_ = 0;
        silence_samples_ = 0;
        consecutive_speech_frames_ = 0;
        current_segment_.clear();
    }

private:
    enum class VADState {
        Silence,
        Speech
    };

    static constexpr int START_FRAMES_REQUIRED = 2;

    VADEvent end_speech() {
        std::ostringstream oss;
        oss << "[VAD] SpeechEnd speech_ms=" << (speech_samples_ * 1000 / sample_rate_)
            << " silence_ms=" << (silence_samples_ * 1000 / sample_rate_);
        LOG_AUDIO(oss.str());
        state_ = VADState::Silence;
        speech_samples_ = 0;
        silence_samples_ = 0;
        return VADEvent::SpeechEnd;
    }

    void update_noise_floor(float rms) {
        const float alpha_silence = 0.92f;   // slow adaptation when in silence
        const float alpha_speech = 0.995f;   // very slow when in speech
        const float min_noise = 0.005f;
        const float max_noise = 0.25f;
        if (state_ == VADState::Silence) {
            if (!noise_floor_initialized_) {
                noise_floor_ = std::max(min_noise, std::min(max_noise, rms));
                noise_floor_initialized_ = true;
            } else {
                noise_floor_ = alpha_silence * noise_floor_ + (1.0f - alpha_silence) * rms;
                noise_floor_ = std::max(min_noise, std::min(max_noise, noise_floor_));
            }
        } else if (rms <= noise_floor_ * 1.5f + 0.02f) {
            noise_floor_ = alpha_speech * noise_floor_ + (1.0f - alpha_speech) * std::max(rms, min_noise);
            noise_floor_ = std::max(min_noise, std::min(max_noise, noise_floor_));
        }
    }

    VADConfig config_;
    int sample_rate_;
    VADState state_;
    float start_threshold_;
    float end_threshold_;
    int consecutive_speech_frames_ = 0;
    int64_t speech_samples_ = 0;
    int64_t silence_samples_ = 0;
    int64_t min_speech_samples_;
    int64_t end_silence_samples_;
    int64_t max_utterance_samples_;
    AudioBuffer current_segment_;
    float noise_floor_;
    bool noise_floor_initialized_;
};

size_t max_utterance_samples(const VADConfig& config, int sample_rate) {
    if (config.max_utterance_ms <= 0 || sample_rate <= 0) return 0;
    return static_cast<size_t>(static_cast<int64_t>(config.max_utterance_ms) * sample_rate / 1000);
}

bool append_capped(AudioBuffer& recording, const AudioFrame& frame, size_t limit) {
    if (recording.size() >= limit) return false;
    size_t room = limit - recording.size();
    if (frame.size() > room) {
        recording.insert(recording.end(), frame.begin(), frame.begin() + static_cast<std::ptrdiff_t>(room));
        return false;
    }
    recording.insert(recording.end(), frame.begin(), frame.end());
    return true;
}

VADEndpointing::VADEndpointing(const VADConfig& config, int sample_rate)
    : pimpl_(std::make_unique<Impl>(config, sample_rate)) {}

VADEndpointing::~VADEndpointing() = default;

VADEvent VADEndpointing::process(const AudioFrame& frame) {
    return pimpl_->process(frame);
}

AudioBuffer VADEndpointing::finalize_segment() {
    return pimpl_->finalize_segment();
}

bool VADEndpointing::in_speech() const {
    return pimpl_->in_speech();
}

void VADEndpointing::reset() {
    pimpl_->reset();
}

float VADEndpointing::compute_energy(const AudioFrame& frame) {
    if (frame.empty()) return 0.0f;

    float sum_sq = 0.0f;
    for (Sample s : frame) {
        float normalized = static_cast<float>(s) / 32768.0f;
        sum_sq += normalized * normalized;
    }
    return std::sqrt(sum_sq / frame.size());
}

} // namespace voice_os
