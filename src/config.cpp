#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include "utils.h"
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void read_string_array(const json& j, const char* key, std::vector<std::string>& out) {
    if (!j.contains(key) || !j[key].is_array()) return;
    out.clear();
    for (const auto& v : j[key]) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
}

void apply_json_to_config(voice_os::Config& cfg, const json& j) {
    if (j.contains("trigger") && j["trigger"].is_object()) {
        const auto& t = j["trigger"];
        if (t.contains("cooldown_ms") && t["cooldown_ms"].is_number_integer()) cfg.trigger.cooldown_ms = t["cooldown_ms"];
        if (t.contains("listen_prompt_delay_ms") && t["listen_prompt_delay_ms"].is_number_integer())
            cfg.trigger.listen_prompt_delay_ms = t["listen_prompt_delay_ms"];
        read_string_array(t, "wake_words", cfg.trigger.wake_words);
        for (auto& w : cfg.trigger.wake_words) voice_os::utils::normalize(w);
        if (t.contains("echo_prefix") && t["echo_prefix"].is_string()) cfg.trigger.echo_prefix = t["echo_prefix"];
    }

    if (j.contains("fast_path") && j["fast_path"].is_object()) {
        const auto& f = j["fast_path"];
        if (f.contains("enabled") && f["enabled"].is_boolean()) cfg.fast_path.enabled = f["enabled"];
        if (f.contains("short_circuit") && f["short_circuit"].is_boolean()) cfg.fast_path.short_circuit = f["short_circuit"];
        if (f.contains("max_app_tokens") && f["max_app_tokens"].is_number_integer()) cfg.fast_path.max_app_tokens = f["max_app_tokens"];
        read_string_array(f, "conjunction_markers", cfg.fast_path.conjunction_markers);
        read_string_array(f, "launch_command", cfg.fast_path.launch_command);
        read_string_array(f, "quit_command", cfg.fast_path.quit_command);
    }

    if (j.contains("agent") && j["agent"].is_object()) {
        const auto& a = j["agent"];
        if (a.contains("endpoint") && a["endpoint"].is_string()) cfg.agent.endpoint = a["endpoint"];
        if (a.contains("model") && a["model"].is_string()) cfg.agent.model = a["model"];
        if (a.contains("api_version") && a["api_version"].is_string()) cfg.agent.api_version = a["api_version"];
        if (a.contains("api_key_env") && a["api_key_env"].is_string()) cfg.agent.api_key_env = a["api_key_env"];
        if (a.contains("env_file") && a["env_file"].is_string()) cfg.agent.env_file = a["env_file"];
        if (a.contains("system_prompt") && a["system_prompt"].is_string()) cfg.agent.system_prompt = a["system_prompt"];
        if (a.contains("system_prompt_suffix") && a["system_prompt_suffix"].is_string())
            cfg.agent.system_prompt_suffix = a["system_prompt_suffix"];
        if (a.contains("max_tokens") && a["max_tokens"].is_number_integer()) cfg.agent.max_tokens = a["max_tokens"];
        if (a.contains("image_retention_limit") && a["image_retention_limit"].is_number_integer())
            cfg.agent.image_retention_limit = a["image_retention_limit"];
        if (a.contains("max_iterations") && a["max_iterations"].is_number_integer())
            cfg.agent.max_iterations = a["max_iterations"];
    }

    if (j.contains("speech") && j["speech"].is_object()) {
        const auto& s = j["speech"];
        read_string_array(s, "tts_command", cfg.speech.tts_command);
        if (s.contains("stt_model_path") && s["stt_model_path"].is_string()) cfg.speech.stt_model_path = s["stt_model_path"];
        if (s.contains("language") && s["language"].is_string()) cfg.speech.language = s["language"];
        if (s.contains("input_device") && s["input_device"].is_string()) cfg.speech.input_device = s["input_device"];
        if (s.contains("sample_rate") && s["sample_rate"].is_number_integer()) cfg.speech.sample_rate = s["sample_rate"];
        if (s.contains("use_gpu") && s["use_gpu"].is_boolean()) cfg.speech.use_gpu = s["use_gpu"];
    }

    if (j.contains("vad") && j["vad"].is_object()) {
        const auto& v = j["vad"];
        if (v.contains("threshold") && v["threshold"].is_number()) cfg.vad.threshold = v["threshold"];
        if (v.contains("end_silence_ms") && v["end_silence_ms"].is_number_integer()) cfg.vad.end_silence_ms = v["end_silence_ms"];
        if (v.contains("min_speech_ms") && v["min_speech_ms"].is_number_integer()) cfg.vad.min_speech_ms = v["min_speech_ms"];
        if (v.contains("max_utterance_ms") && v["max_utterance_ms"].is_number_integer()) cfg.vad.max_utterance_ms = v["max_utterance_ms"];
    }

    if (j.contains("tools") && j["tools"].is_object()) {
        const auto& tools = j["tools"];
        if (tools.contains("timeout_ms") && tools["timeout_ms"].is_number_integer()) cfg.tools.timeout_ms = tools["timeout_ms"];
        if (tools.contains("max_concurrent") && tools["max_concurrent"].is_number_unsigned())
            cfg.tools.max_concurrent = tools["max_concurrent"];
        read_string_array(tools, "enabled", cfg.tools.enabled);
    }

    if (j.contains("log") && j["log"].is_object()) {
        const auto& l = j["log"];
        if (l.contains("level") && l["level"].is_string()) cfg.log.level = l["level"];
        if (l.contains("file") && l["file"].is_string()) cfg.log.file = l["file"];
    }
}

} // anonymous namespace

namespace voice_os {

Config::Config() {
#if defined(__APPLE__)
    fast_path.launch_command = {"open", "-a", "{app}"};
    fast_path.quit_command = {"osascript", "-e", "quit app \"{app}\""};
    speech.tts_command = {"say", "{text}"};
#else
    fast_path.launch_command = {"gtk-launch", "{app}"};
    fast_path.quit_command = {"pkill", "-TERM", "-x", "{app}"};
    speech.tts_command = {"espeak-ng", "{text}"};
#endif
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(expand_path(path));
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
        return cfg;
    }
    json j;
    try { file >> j; } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()));
        return cfg;
    }
    apply_json_to_config(cfg, j);

    if (!cfg.speech.stt_model_path.empty()) cfg.speech.stt_model_path = expand_path(cfg.speech.stt_model_path);
    if (!cfg.agent.env_file.empty()) cfg.agent.env_file = expand_path(cfg.agent.env_file);
    if (!cfg.log.file.empty()) cfg.log.file = expand_path(cfg.log.file);

    return cfg;
}

void Config::apply_json(const std::string& json_text) {
    try {
        apply_json_to_config(*this, json::parse(json_text));
    } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()));
    }
}

bool Config::save_to_file(const std::string& path) const {
    json j;

    j["trigger"]["cooldown_ms"] = trigger.cooldown_ms;
    j["trigger"]["listen_prompt_delay_ms"] = trigger.listen_prompt_delay_ms;
    j["trigger"]["wake_words"] = trigger.wake_words;
    j["trigger"]["echo_prefix"] = trigger.echo_prefix;

    j["fast_path"]["enabled"] = fast_path.enabled;
    j["fast_path"]["short_circuit"] = fast_path.short_circuit;
    j["fast_path"]["max_app_tokens"] = fast_path.max_app_tokens;
    j["fast_path"]["conjunction_markers"] = fast_path.conjunction_markers;
    j["fast_path"]["launch_command"] = fast_path.launch_command;
    j["fast_path"]["quit_command"] = fast_path.quit_command;

    j["agent"]["endpoint"] = agent.endpoint;
    j["agent"]["model"] = agent.model;
    j["agent"]["api_version"] = agent.api_version;
    j["agent"]["api_key_env"] = agent.api_key_env;
    j["agent"]["env_file"] = agent.env_file;
    j["agent"]["system_prompt"] = agent.system_prompt;
    j["agent"]["system_prompt_suffix"] = agent.system_prompt_suffix;
    j["agent"]["max_tokens"] = agent.max_tokens;
    j["agent"]["image_retention_limit"] = agent.image_retention_limit;
    j["agent"]["max_iterations"] = agent.max_iterations;

    j["speech"]["tts_command"] = speech.tts_command;
    j["speech"]["stt_model_path"] = speech.stt_model_path;
    j["speech"]["language"] = speech.language;
    j["speech"]["input_device"] = speech.input_device;
    j["speech"]["sample_rate"] = speech.sample_rate;
    j["speech"]["use_gpu"] = speech.use_gpu;

    j["vad"]["threshold"] = vad.threshold;
    j["vad"]["end_silence_ms"] = vad.end_silence_ms;
    j["vad"]["min_speech_ms"] = vad.min_speech_ms;
    j["vad"]["max_utterance_ms"] = vad.max_utterance_ms;

    j["tools"]["enabled"] = tools.enabled;
    j["tools"]["timeout_ms"] = tools.timeout_ms;
    j["tools"]["max_concurrent"] = tools.max_concurrent;

    j["log"]["level"] = log.level;
    j["log"]["file"] = log.file;

    std::ofstream file(expand_path(path));
    if (!file.is_open()) {
        Logger::warn("Could not write config file: " + path);
        return false;
    }
    file << j.dump(2);
    return true;
}

} // namespace voice_os
