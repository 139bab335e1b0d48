#include "stt_engine.h"
#include "logger.h"
#include "path_utils.h"
#include <whisper.h>
#include <chrono>
#include <mutex>
#include <sstream>
#include <vector>

namespace voice_os {

class STTEngine::Impl {
public:
    Impl(const SpeechConfig& config) : config_(config), ctx_(nullptr), ready_(false) {
        if (config_.stt_model_path.empty()) {
            LOG_STT("No model path specified");
            return;
        }
        std::string model_path = expand_path(config_.stt_model_path);

        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config_.use_gpu;

        ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
        if (!ctx_) {
            Logger::error("[STT] Failed to load whisper model: " + model_path);
            return;
        }

        ready_ = true;
        LOG_STT("Model loaded: " + model_path);
    }

    ~Impl() {
        if (ctx_) {
            whisper_free(ctx_);
        }
    }

    Transcript transcribe(const AudioBuffer& segment) {
        Transcript result;
        if (!ctx_ || segment.empty()) {
            return result;
        }

        // One whisper context; gesture and wake-word capture may share it
        std::lock_guard<std::mutex> lock(mutex_);
        auto start = std::chrono::steady_clock::now();

        struct whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.translate = false;
        params.language = config_.language.c_str();
        params.n_threads = 4;
        params.offset_ms = 0;
        params.no_context = true;
        params.single_segment = true;

        std::vector<float> pcmf32(segment.size());
        for (size_t i = 0; i < segment.size(); i++) {
            pcmf32[i] = static_cast<float>(segment[i]) / 32768.0f;
        }

        int ret = whisper_full(ctx_, params, pcmf32.data(), static_cast<int>(pcmf32.size()));
        if (ret != 0) {
            std::ostringstream oss;
            oss << "whisper_full failed: " << ret;
            LOG_STT(oss.str());
            return result;
        }

        int n_segments = whisper_full_n_segments(ctx_);
        int total_tokens = 0;
        float total_prob = 0.0f;
        std::string text;
        for (int i = 0; i < n_segments; i++) {
            text += whisper_full_get_segment_text(ctx_, i);
            int n_tokens = whisper_full_n_tokens(ctx_, i);
            total_tokens += n_tokens;
            for (int j = 0; j < n_tokens; j++) {
                total_prob += whisper_full_get_token_p(ctx_, i, j);
            }
        }
        result.text = text;
        result.confidence = total_tokens > 0 ? (total_prob / total_tokens) : 0.0f;
        result.token_count = total_tokens;

        auto end = std::chrono::steady_clock::now();
        result.processing_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
        LOG_STT("Transcribed in " + std::to_string(result.processing_ms) + " ms: \"" + result.text + "\"");
        return result;
    }

    bool is_ready() const {
        return ready_;
    }

private:
    SpeechConfig config_;
    whisper_context* ctx_;
    bool ready_;
    std::mutex mutex_;
};

STTEngine::STTEngine(const SpeechConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

STTEngine::~STTEngine() = default;

Transcript STTEngine::transcribe(const AudioBuffer& segment) {
    return pimpl_->transcribe(segment);
}

bool STTEngine::is_ready() const {
    return pimpl_->is_ready();
}

} // namespace voice_os
