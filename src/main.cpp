#include "agent_client.h"
#include "assistant.h"
#include "audio_capture.h"
#include "config.h"
#include "logger.h"
#include "os/app_controller.h"
#include "path_utils.h"
#include "speech/microphone_transcriber.h"
#include "speech/process_speaker.h"
#include "status_channel.h"
#include "triggers/gesture_trigger.h"
#include "triggers/text_trigger.h"
#include "triggers/wake_word_trigger.h"
#include "vision/json_landmark_stream.h"
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace voice_os {

static Assistant* g_assistant = nullptr;

void signal_handler(int signal) {
    (void)signal;
    Logger::info("\nShutting down...");
    if (g_assistant) {
        g_assistant->shutdown();
    }
}

static void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [config.json] [--mode console|headless|gesture] [--list-devices]\n"
              << "  console   typed commands on stdin (\"/reset\" clears the conversation)\n"
              << "  headless  microphone, commands opened by a wake word\n"
              << "  gesture   hand landmarks as JSON lines on stdin, microphone capture\n";
}

/// Mirror status events to the console for the entry points without a panel
static void print_status(StatusChannel& channel) {
    while (true) {
        auto event = channel.wait(std::chrono::milliseconds(500));
        if (!event) {
            if (channel.closed()) return;
            continue;
        }
        std::cout << "[" << to_string(event->kind) << "] " << event->text << std::endl;
    }
}

} // namespace voice_os

int main(int argc, char* argv[]) {
    using namespace voice_os;

    std::string config_path = "config/voice_os.json";
    std::string mode = "console";
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--list-devices") {
            AudioCapture::list_devices();
            return 0;
        } else if (arg == "--mode" && i + 1 < argc) {
            mode = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            config_path = arg;
        }
    }
    if (mode != "console" && mode != "headless" && mode != "gesture") {
        print_usage(argv[0]);
        return 2;
    }

    Config config = Config::load_from_file(config_path);
    Logger::initialize(Logger::parse_level(config.log.level), config.log.file);

    if (mode == "gesture" && config.agent.system_prompt_suffix.empty()) {
        config.agent.system_prompt_suffix = Assistant::GESTURE_PROMPT_SUFFIX;
    }

    std::string api_key = resolve_credential(config.agent.api_key_env, config.agent.env_file);
    if (api_key.empty()) {
        Logger::error("No API key: set " + config.agent.api_key_env + " or add it to " + config.agent.env_file);
        Logger::shutdown();
        return 1;
    }

    StatusChannel status;
    AssistantParts parts;
    parts.agent = std::make_shared<AgentClient>(config.agent, api_key);
    parts.apps = std::make_shared<CommandAppController>(config.fast_path.launch_command,
                                                        config.fast_path.quit_command);
    parts.speech = std::make_shared<ProcessSpeaker>(config.speech.tts_command);
    parts.status = &status;

    std::thread status_thread(print_status, std::ref(status));

    int result = 0;
    try {
        Assistant assistant(config, parts);
        g_assistant = &assistant;
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        if (mode == "console") {
            TextTrigger typed(std::cin, &assistant);
            result = assistant.run({&typed});
        } else {
            MicrophoneTranscriber microphone(config.speech, config.vad);
            if (!microphone.is_ready()) {
                Logger::error("Speech recognizer not available (speech.stt_model_path)");
                result = 1;
            } else if (mode == "headless") {
                WakeWordTrigger wake(microphone, config.trigger.wake_words);
                result = assistant.run({&wake});
            } else {
                JsonLandmarkStream landmarks(std::cin);
                GestureTrigger gesture(landmarks, microphone, &assistant,
                                       std::chrono::milliseconds(config.trigger.cooldown_ms));
                result = assistant.run({&gesture});
            }
        }

        g_assistant = nullptr;
    } catch (const std::exception& e) {
        g_assistant = nullptr;
        Logger::error(std::string("Fatal: ") + e.what());
        result = 1;
    }

    status.close();
    status_thread.join();

    parts.speech->stop();
    Logger::shutdown();
    return result;
}
