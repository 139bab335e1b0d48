#pragma once

#include <array>
#include <string>

namespace voice_os {

/**
 * @brief One tracked hand point in normalized image coordinates
 *
 * y grows downward, so a fingertip "above" its proximal joint has the smaller y.
 */
struct Landmark {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

/// 21-point hand skeleton as produced by the external hand tracker
using HandLandmarks = std::array<Landmark, 21>;

/**
 * @brief Discrete gestures recognized from a single frame
 */
enum class Gesture {
    None,
    OpenPalm,    ///< start listening
    ClosedFist,  ///< stop listening
    Victory      ///< reset history
};

const char* to_string(Gesture gesture);

/// All four tracked fingertips above their proximal joints
bool is_open_palm(const HandLandmarks& hand);

/// All four tracked fingertips below their proximal joints
bool is_closed_fist(const HandLandmarks& hand);

/// Index and middle extended, ring and pinky curled
bool is_victory_hand(const HandLandmarks& hand);

/**
 * @brief Classify one frame
 *
 * Checked in the order open palm, closed fist, victory. A victory hand is
 * never an open palm or a fist, so the order only matters for ties that
 * cannot occur.
 */
Gesture classify_gesture(const HandLandmarks& hand);

} // namespace voice_os
