#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include "core/constants.h"

namespace voice_os {

struct TriggerConfig {
    int cooldown_ms = constants::trigger::COOLDOWN_MS;              ///< Minimum time between accepted gesture transitions
    int listen_prompt_delay_ms = constants::trigger::LISTEN_PROMPT_DELAY_MS;    ///< Pause after the "Listening" prompt before capture starts
    std::vector<std::string> wake_words = {"voiceos", "voice os"};
    std::string echo_prefix = "listening";  ///< Leading word removed from transcripts (our own prompt)
};

/// Local launch/quit shortcut that runs before the remote agent.
struct FastPathConfig {
    bool enabled = true;
    /// true: a successful local action ends the command; false: the note is sent to the agent as context
    bool short_circuit = true;
    int max_app_tokens = static_cast<int>(constants::fast_path::MAX_APP_TOKENS);
    std::vector<std::string> conjunction_markers = {"and", "then"};
    /// argv templates; "{app}" is replaced by the captured application name
    std::vector<std::string> launch_command;
    std::vector<std::string> quit_command;
};

struct AgentConfig {
    std::string endpoint = "https://api.anthropic.com/v1/messages";
    std::string model = "claude-sonnet-4-5";
    std::string api_version = "2023-06-01";
    std::string api_key_env = "ANTHROPIC_API_KEY";
    std::string env_file = ".env";
    std::string system_prompt = "You are a desktop assistant operated by voice and hand gestures. "
                                "Use the available tools to act on the user's computer.";
    std::string system_prompt_suffix;
    int max_tokens = constants::agent::DEFAULT_MAX_TOKENS;
    int image_retention_limit = static_cast<int>(constants::agent::IMAGE_RETENTION_LIMIT);   ///< Most recent tool-result images kept in each request
    int max_iterations = constants::agent::MAX_ITERATIONS;         ///< Model/tool round trips per exchange
};

struct SpeechConfig {
    /// argv template for the speech process; "{text}" is replaced, otherwise text goes to stdin
    std::vector<std::string> tts_command;
    std::string stt_model_path;
    std::string language = "en";
    std::string input_device;
    int sample_rate = 16000;
    bool use_gpu = true;
};

struct VADConfig {
    float threshold = constants::vad::DEFAULT_THRESHOLD;        ///< RMS at or above this counts as speech
    int end_silence_ms = constants::vad::END_SILENCE_MS;       ///< Silence that ends an utterance (wake-word listening)
    int min_speech_ms = constants::vad::MIN_SPEECH_MS;        ///< Shorter bursts are discarded
    int max_utterance_ms = constants::vad::MAX_UTTERANCE_MS;   ///< Hard cap on one wake-word utterance
};

struct ToolsConfig {
    std::vector<std::string> enabled = {"app_control"};
    int timeout_ms = 10000;         ///< Per-tool execution limit
    size_t max_concurrent = 2;      ///< Tool worker threads
};

struct LogConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    TriggerConfig trigger;
    FastPathConfig fast_path;
    AgentConfig agent;
    SpeechConfig speech;
    VADConfig vad;
    ToolsConfig tools;
    LogConfig log;

    Config();

    static Config load_from_file(const std::string& path);
    /// Apply a parsed JSON document on top of this configuration
    void apply_json(const std::string& json_text);
    bool save_to_file(const std::string& path) const;
};

} // namespace voice_os
