#include "audio_capture.h"
#include "logger.h"
#include <portaudio.h>
#include <sstream>

namespace voice_os {

class AudioCapture::Impl {
public:
    Impl() : stream_(nullptr), initialized_(false), frame_samples_(SAMPLES_PER_FRAME) {}

    ~Impl() {
        stop();
    }

    bool start(const std::string& input_device, int sample_rate) {
        if (stream_) {
            return true;
        }
        frame_samples_ = (sample_rate * FRAME_SIZE_MS) / 1000;

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return false;
        }
        initialized_ = true;

        int input_idx = find_device(input_device);
        if (input_idx < 0) {
            Logger::error("Input device not found: " + input_device);
            terminate();
            return false;
        }
        const PaDeviceInfo* input_info = Pa_GetDeviceInfo(input_idx);
        if (!input_info || input_info->maxInputChannels == 0) {
            Logger::error("Device has no input channels: " + input_device);
            terminate();
            return false;
        }

        std::ostringstream dev_oss;
        dev_oss << "Using input device: [" << input_idx << "] " << input_info->name;
        LOG_AUDIO(dev_oss.str());

        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = 1;
        input_params.sampleFormat = paInt16;
        input_params.suggestedLatency = input_info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&stream_, &input_params, nullptr, sample_rate,
                            frame_samples_, paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            Logger::error("Failed to open input stream: " + std::string(Pa_GetErrorText(err)));
            stream_ = nullptr;
            terminate();
            return false;
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            std::ostringstream err_oss;
            err_oss << "Failed to start input stream: " << Pa_GetErrorText(err)
                    << " (Error code: " << err << ")";
            Logger::error(err_oss.str());
            if (err == paUnanticipatedHostError) {
                Logger::error("This may be a microphone permissions issue.");
            }
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            terminate();
            return false;
        }

        return true;
    }

    bool read_frame(AudioFrame& frame) {
        if (!stream_) return false;

        frame.resize(frame_samples_);
        PaError err = Pa_ReadStream(stream_, frame.data(), frame_samples_);
        if (err == paInputOverflowed) {
            Logger::warn("Input overflow");
        } else if (err != paNoError) {
            Logger::error("Input read failed: " + std::string(Pa_GetErrorText(err)));
            return false;
        }
        return true;
    }

    bool is_running() const {
        return stream_ != nullptr;
    }

    void stop() {
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
        terminate();
    }

    static void list_devices() {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return;
        }

        int num_devices = Pa_GetDeviceCount();
        Logger::info("Available input devices:");
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info || info->maxInputChannels == 0) continue;
            std::ostringstream oss;
            oss << "  [" << i << "] " << info->name << " (IN:" << info->maxInputChannels << ")";
            Logger::info(oss.str());
        }

        Pa_Terminate();
    }

private:
    void terminate() {
        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
    }

    int find_device(const std::string& name) {
        int num_devices = Pa_GetDeviceCount();

        if (name == "default" || name.empty()) {
            int default_idx = Pa_GetDefaultInputDevice();
            return default_idx == paNoDevice ? -1 : default_idx;
        }

        // Numeric device index
        try {
            int device_idx = std::stoi(name);
            if (device_idx >= 0 && device_idx < num_devices) {
                return device_idx;
            }
        } catch (const std::exception&) {
            // Not a number, continue to name matching
        }

        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (info && info->name == name && info->maxInputChannels > 0) {
                return i;
            }
        }
        return -1;
    }

    PaStream* stream_;
    bool initialized_;
    int frame_samples_;
};

AudioCapture::AudioCapture() : pimpl_(std::make_unique<Impl>()) {}
AudioCapture::~AudioCapture() = default;

bool AudioCapture::start(const std::string& input_device, int sample_rate) {
    return pimpl_->start(input_device, sample_rate);
}

bool AudioCapture::read_frame(AudioFrame& frame) {
    return pimpl_->read_frame(frame);
}

bool AudioCapture::is_running() const {
    return pimpl_->is_running();
}

void AudioCapture::stop() {
    pimpl_->stop();
}

void AudioCapture::list_devices() {
    Impl::list_devices();
}

} // namespace voice_os
