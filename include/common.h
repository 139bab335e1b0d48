#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>
#include <utility>

namespace voice_os {

// Audio types
using Sample = int16_t;
using AudioFrame = std::vector<Sample>;
using AudioBuffer = std::vector<Sample>;

// Timing
using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

// Audio format constants
constexpr int DEFAULT_SAMPLE_RATE = 16000;
constexpr int FRAME_SIZE_MS = 20;
constexpr int SAMPLES_PER_FRAME = (DEFAULT_SAMPLE_RATE * FRAME_SIZE_MS) / 1000; // 320 samples @ 16kHz

// Transcript result
struct Transcript {
    std::string text;
    float confidence = 0.0f;
    int64_t processing_ms = 0;
    int token_count = 0;
};

/**
 * @brief Which trigger produced a command
 */
enum class CommandSource {
    Gesture,   ///< Open palm / closed fist capture window
    WakeWord,  ///< Spoken utterance opened by a wake word
    Typed      ///< Text entered on the console or panel
};

/**
 * @brief A recognized user command. Immutable once produced by a trigger.
 */
struct Command {
    const std::string text;
    const CommandSource source;

    Command(std::string t, CommandSource s) : text(std::move(t)), source(s) {}
};

inline const char* to_string(CommandSource source) {
    switch (source) {
        case CommandSource::Gesture:  return "gesture";
        case CommandSource::WakeWord: return "wake-word";
        case CommandSource::Typed:    return "typed";
    }
    return "unknown";
}

} // namespace voice_os
