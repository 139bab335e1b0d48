/**
 * Gesture classification, trigger state machine and gesture trigger.
 * Asserts:
 * - Open palm and closed fist are exclusive; a hand may be neither.
 * - Transitions inside the cooldown window are dropped.
 * - Open palm -> closed fist turns the captured transcript into a command.
 *
 * Run from build dir: ./test_gesture
 * No camera or microphone required.
 */

#include "core/constants.h"
#include "gesture.h"
#include "state_machine.h"
#include "triggers/gesture_trigger.h"
#include "vision/json_landmark_stream.h"
#include <deque>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace voice_os;
using namespace std::chrono_literals;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

using namespace constants::trigger;

/// PIP joints at y=0.5; an extended finger has its tip above (smaller y)
HandLandmarks make_hand(bool index, bool middle, bool ring, bool pinky) {
    HandLandmarks hand{};
    auto finger = [&hand](int tip, int pip, bool up) {
        hand[pip].y = 0.5f;
        hand[tip].y = up ? 0.3f : 0.7f;
    };
    finger(INDEX_TIP, INDEX_PIP, index);
    finger(MIDDLE_TIP, MIDDLE_PIP, middle);
    finger(RING_TIP, RING_PIP, ring);
    finger(PINKY_TIP, PINKY_PIP, pinky);
    return hand;
}

const HandLandmarks OPEN = make_hand(true, true, true, true);
const HandLandmarks FIST = make_hand(false, false, false, false);
const HandLandmarks VICTORY = make_hand(true, true, false, false);
const HandLandmarks POINTING = make_hand(true, false, false, false);

class ScriptedLandmarks : public LandmarkSource {
public:
    void push(const HandLandmarks& hand) { frames_.push_back(LandmarkFrame{hand}); }
    void push_empty() { frames_.push_back(LandmarkFrame{}); }

    std::optional<LandmarkFrame> next_frame() override {
        std::this_thread::sleep_for(5ms);
        if (frames_.empty()) return std::nullopt;
        LandmarkFrame frame = frames_.front();
        frames_.pop_front();
        return frame;
    }

private:
    std::deque<LandmarkFrame> frames_;
};

class FakeMicrophone : public SpeechInput {
public:
    explicit FakeMicrophone(std::string transcript) : transcript_(std::move(transcript)) {}

    Result<std::string> capture_until_stopped(const std::atomic<bool>& stop) override {
        captures++;
        while (!stop.load()) {
            std::this_thread::sleep_for(1ms);
        }
        return transcript_;
    }

    Result<std::string> listen_for_utterance(const std::atomic<bool>&) override {
        return std::string();
    }

    std::atomic<int> captures{0};

private:
    std::string transcript_;
};

class RecordingListener : public TriggerListener {
public:
    void on_listening_started() override { listening++; }
    void on_reset_requested() override { resets++; }

    int listening = 0;
    int resets = 0;
};

} // anonymous namespace

int main() {
    // --- classifiers ---
    ASSERT(is_open_palm(OPEN));
    ASSERT(!is_closed_fist(OPEN));
    ASSERT(is_closed_fist(FIST));
    ASSERT(!is_open_palm(FIST));
    ASSERT(is_victory_hand(VICTORY));
    ASSERT(!is_open_palm(VICTORY) && !is_closed_fist(VICTORY));
    ASSERT(!is_open_palm(POINTING) && !is_closed_fist(POINTING) && !is_victory_hand(POINTING));
    ASSERT(classify_gesture(POINTING) == Gesture::None);
    ASSERT(classify_gesture(OPEN) == Gesture::OpenPalm);
    ASSERT(classify_gesture(FIST) == Gesture::ClosedFist);
    ASSERT(classify_gesture(VICTORY) == Gesture::Victory);

    // Tip level with its joint is neither extended nor curled
    HandLandmarks flat{};
    ASSERT(!is_open_palm(flat) && !is_closed_fist(flat));

    // --- state machine ---
    {
        StateMachine sm(2000ms);
        TimePoint t0 = std::chrono::steady_clock::now();
        ASSERT(sm.get_state() == State::Idle);

        // Fist while idle does nothing
        ASSERT(sm.on_gesture(Gesture::ClosedFist, t0) == TriggerAction::None);
        ASSERT(sm.on_gesture(Gesture::OpenPalm, t0) == TriggerAction::StartListening);
        ASSERT(sm.get_state() == State::Listening);

        // Within cooldown: dropped
        ASSERT(sm.on_gesture(Gesture::ClosedFist, t0 + 1500ms) == TriggerAction::None);
        ASSERT(sm.get_state() == State::Listening);
        // Exactly at the boundary is still inside the window
        ASSERT(sm.on_gesture(Gesture::ClosedFist, t0 + 2000ms) == TriggerAction::None);
        ASSERT(sm.on_gesture(Gesture::ClosedFist, t0 + 2001ms) == TriggerAction::StopListening);
        ASSERT(sm.get_state() == State::Idle);

        // Victory only counts while idle, and also honours the cooldown
        ASSERT(sm.on_gesture(Gesture::Victory, t0 + 2500ms) == TriggerAction::None);
        ASSERT(sm.on_gesture(Gesture::Victory, t0 + 4100ms) == TriggerAction::ResetHistory);
        ASSERT(sm.get_state() == State::Idle);

        // Open palm while listening is ignored
        ASSERT(sm.on_gesture(Gesture::OpenPalm, t0 + 6200ms) == TriggerAction::StartListening);
        ASSERT(sm.on_gesture(Gesture::OpenPalm, t0 + 9000ms) == TriggerAction::None);
        ASSERT(sm.on_gesture(Gesture::Victory, t0 + 9000ms) == TriggerAction::None);

        sm.reset();
        ASSERT(sm.get_state() == State::Idle);
        ASSERT(sm.on_hand(OPEN, t0 + 9001ms) == TriggerAction::StartListening);
    }

    // Two qualifying detections inside the window: exactly one transition
    {
        StateMachine sm(2000ms);
        TimePoint t0 = std::chrono::steady_clock::now();
        int transitions = 0;
        if (sm.on_gesture(Gesture::Victory, t0) != TriggerAction::None) transitions++;
        if (sm.on_gesture(Gesture::Victory, t0 + 100ms) != TriggerAction::None) transitions++;
        ASSERT(transitions == 1);
    }

    // --- landmark stream ---
    {
        std::ostringstream hand;
        hand << "[";
        for (int i = 0; i < LANDMARK_COUNT; i++) {
            if (i) hand << ",";
            hand << "[0.1," << (i == INDEX_TIP ? 0.2 : 0.5) << ",0.0]";
        }
        hand << "]";

        auto parsed = JsonLandmarkStream::parse_line("{\"hands\": [" + hand.str() + "]}");
        ASSERT(parsed.is_ok());
        ASSERT(parsed.value().size() == 1);
        ASSERT(parsed.value()[0][INDEX_TIP].y < parsed.value()[0][INDEX_PIP].y);

        auto bare = JsonLandmarkStream::parse_line("[" + hand.str() + "," + hand.str() + "]");
        ASSERT(bare.is_ok() && bare.value().size() == 2);

        auto none = JsonLandmarkStream::parse_line("{\"hands\": []}");
        ASSERT(none.is_ok() && none.value().empty());

        std::string objects = "[[";
        for (int i = 0; i < LANDMARK_COUNT; i++) {
            if (i) objects += ",";
            objects += "{\"x\":0.5,\"y\":0.5}";
        }
        objects += "]]";
        auto object_points = JsonLandmarkStream::parse_line(objects);
        ASSERT(object_points.is_ok() && object_points.value().size() == 1);

        ASSERT(JsonLandmarkStream::parse_line("not json").is_error());
        ASSERT(JsonLandmarkStream::parse_line("{\"frame\": 1}").is_error());
        ASSERT(JsonLandmarkStream::parse_line("[[[0,0,0]]]").is_error());

        std::istringstream input("{\"hands\": [" + hand.str() + "]}\n\ngarbage\n");
        JsonLandmarkStream stream(input);
        auto f1 = stream.next_frame();
        ASSERT(f1 && f1->size() == 1);
        auto f2 = stream.next_frame();
        ASSERT(f2 && f2->empty());
        auto f3 = stream.next_frame();
        ASSERT(f3 && f3->empty());   // malformed lines read as frames without hands
        ASSERT(!stream.next_frame());
    }

    // --- gesture trigger: palm, fist, victory ---
    {
        ScriptedLandmarks landmarks;
        landmarks.push(FIST);       // ignored while idle
        landmarks.push(OPEN);
        landmarks.push_empty();
        landmarks.push(OPEN);       // already listening
        landmarks.push(FIST);
        landmarks.push(VICTORY);

        FakeMicrophone microphone("open safari");
        RecordingListener listener;
        GestureTrigger trigger(landmarks, microphone, &listener, 1ms);

        auto command = trigger.produce();
        ASSERT(command.has_value());
        if (command) {
            ASSERT(command->text == "open safari");
            ASSERT(command->source == CommandSource::Gesture);
        }
        ASSERT(listener.listening == 1);
        ASSERT(microphone.captures == 1);
        ASSERT(trigger.state() == State::Idle);

        // Victory resets, then the stream ends
        auto rest = trigger.produce();
        ASSERT(!rest.has_value());
        ASSERT(listener.resets == 1);
    }

    // --- gesture trigger: empty transcript produces no command ---
    {
        ScriptedLandmarks landmarks;
        landmarks.push(OPEN);
        landmarks.push(FIST);

        FakeMicrophone microphone("");
        GestureTrigger trigger(landmarks, microphone, nullptr, 1ms);
        ASSERT(!trigger.produce().has_value());
        ASSERT(microphone.captures == 1);
    }

    // --- gesture trigger: stream ends mid-capture ---
    {
        ScriptedLandmarks landmarks;
        landmarks.push(OPEN);

        FakeMicrophone microphone("never used");
        GestureTrigger trigger(landmarks, microphone, nullptr, 1ms);
        ASSERT(!trigger.produce().has_value());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All gesture tests passed.\n";
    return 0;
}
