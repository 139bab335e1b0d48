#pragma once

/**
 * @file constants.h
 * @brief System-wide constants and tuning parameters
 *
 * Defaults for the configurable values live here so config.h and the
 * components agree on them.
 */

#include <cstddef>

namespace voice_os {
namespace constants {

// =============================================================================
// Trigger Constants
// =============================================================================

namespace trigger {
    /// Minimum time between accepted gesture transitions (ms)
    constexpr int COOLDOWN_MS = 2000;

    /// Pause after speaking "Listening" before the microphone opens (ms)
    constexpr int LISTEN_PROMPT_DELAY_MS = 500;

    /// Landmark indices used by the classifiers (21-point hand model)
    constexpr int INDEX_PIP = 6;
    constexpr int INDEX_TIP = 8;
    constexpr int MIDDLE_PIP = 10;
    constexpr int MIDDLE_TIP = 12;
    constexpr int RING_PIP = 14;
    constexpr int RING_TIP = 16;
    constexpr int PINKY_PIP = 18;
    constexpr int PINKY_TIP = 20;
    constexpr int LANDMARK_COUNT = 21;
}

// =============================================================================
// Fast-Path Constants
// =============================================================================

namespace fast_path {
    /// Longest app name (in words) accepted before falling through to the agent
    constexpr std::size_t MAX_APP_TOKENS = 3;
}

// =============================================================================
// Remote Agent Constants
// =============================================================================

namespace agent {
    /// Max tokens per model response
    constexpr int DEFAULT_MAX_TOKENS = 1024;

    /// Image blocks kept in tool results when building a request
    constexpr std::size_t IMAGE_RETENTION_LIMIT = 3;

    /// Model request / tool execution rounds per exchange
    constexpr int MAX_ITERATIONS = 10;
}

// =============================================================================
// VAD Constants
// =============================================================================

namespace vad {
    /// Default RMS threshold for speech detection (normalized 0-1)
    constexpr float DEFAULT_THRESHOLD = 0.05f;

    /// Minimum speech duration to be considered valid (ms)
    constexpr int MIN_SPEECH_MS = 200;

    /// Silence duration to end utterance (ms)
    constexpr int END_SILENCE_MS = 800;

    /// Maximum utterance before force-ending (ms)
    constexpr int MAX_UTTERANCE_MS = 15000;
}

} // namespace constants
} // namespace voice_os
