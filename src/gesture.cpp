#include "gesture.h"
#include "core/constants.h"

namespace voice_os {

namespace {

using namespace constants::trigger;

bool extended(const HandLandmarks& hand, int tip, int pip) {
    return hand[tip].y < hand[pip].y;
}

bool curled(const HandLandmarks& hand, int tip, int pip) {
    return hand[tip].y > hand[pip].y;
}

} // anonymous namespace

const char* to_string(Gesture gesture) {
    switch (gesture) {
        case Gesture::OpenPalm: return "open_palm";
        case Gesture::ClosedFist: return "closed_fist";
        case Gesture::Victory: return "victory";
        case Gesture::None: break;
    }
    return "none";
}

bool is_open_palm(const HandLandmarks& hand) {
    return extended(hand, INDEX_TIP, INDEX_PIP) &&
           extended(hand, MIDDLE_TIP, MIDDLE_PIP) &&
           extended(hand, RING_TIP, RING_PIP) &&
           extended(hand, PINKY_TIP, PINKY_PIP);
}

bool is_closed_fist(const HandLandmarks& hand) {
    return curled(hand, INDEX_TIP, INDEX_PIP) &&
           curled(hand, MIDDLE_TIP, MIDDLE_PIP) &&
           curled(hand, RING_TIP, RING_PIP) &&
           curled(hand, PINKY_TIP, PINKY_PIP);
}

bool is_victory_hand(const HandLandmarks& hand) {
    return extended(hand, INDEX_TIP, INDEX_PIP) &&
           extended(hand, MIDDLE_TIP, MIDDLE_PIP) &&
           curled(hand, RING_TIP, RING_PIP) &&
           curled(hand, PINKY_TIP, PINKY_PIP);
}

Gesture classify_gesture(const HandLandmarks& hand) {
    if (is_open_palm(hand)) return Gesture::OpenPalm;
    if (is_closed_fist(hand)) return Gesture::ClosedFist;
    if (is_victory_hand(hand)) return Gesture::Victory;
    return Gesture::None;
}

} // namespace voice_os
