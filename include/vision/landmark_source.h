#pragma once

#include "gesture.h"
#include <optional>
#include <vector>

namespace voice_os {

/// All hands detected in one camera frame (possibly none)
using LandmarkFrame = std::vector<HandLandmarks>;

/**
 * @brief Per-frame hand landmarks from an external tracker
 */
class LandmarkSource {
public:
    virtual ~LandmarkSource() = default;

    /// Blocks for the next frame; std::nullopt when the stream has ended
    virtual std::optional<LandmarkFrame> next_frame() = 0;
};

} // namespace voice_os
