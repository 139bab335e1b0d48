#pragma once

#include "common.h"
#include <string>
#include <memory>

namespace voice_os {

/**
 * @brief Microphone input using PortAudio
 *
 * Opens a single mono 16-bit input stream and hands out fixed-size frames
 * (FRAME_SIZE_MS of audio each). Reads block until a frame is available.
 *
 * Thread Safety:
 * - One reader at a time; start()/stop() must not race with read_frame()
 */
class AudioCapture {
public:
    AudioCapture();
    ~AudioCapture();

    // Non-copyable
    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /**
     * @brief Open and start the input stream
     * @param input_device Device name, numeric index, or empty/"default" for the system default
     * @param sample_rate Capture rate in Hz (typically 16000)
     * @return True if the stream is running
     */
    bool start(const std::string& input_device, int sample_rate);

    /**
     * @brief Read one frame (blocking)
     * @param frame Resized to the frame length for the configured rate
     * @return False on error or when the stream is not running
     */
    bool read_frame(AudioFrame& frame);

    bool is_running() const;

    /// Stop and close the stream
    void stop();

    /**
     * @brief List all input devices to the log
     */
    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace voice_os
