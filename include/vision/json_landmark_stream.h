#pragma once

#include "errors.h"
#include "vision/landmark_source.h"
#include <istream>
#include <string>

namespace voice_os {

/**
 * @brief Reads landmark frames as JSON lines
 *
 * One line per camera frame, either {"hands": [...]} or a bare array of
 * hands. Each hand is 21 points, given as [x, y, z] or {"x":..,"y":..,"z":..}
 * in normalized image coordinates (y grows downward). Malformed lines are
 * logged and read as frames without hands.
 */
class JsonLandmarkStream : public LandmarkSource {
public:
    explicit JsonLandmarkStream(std::istream& input);

    std::optional<LandmarkFrame> next_frame() override;

    /// Parse one line
    static Result<LandmarkFrame> parse_line(const std::string& line);

private:
    std::istream& input_;
    size_t line_number_ = 0;
};

} // namespace voice_os
