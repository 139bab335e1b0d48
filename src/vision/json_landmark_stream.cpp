#include "vision/json_landmark_stream.h"
#include "core/constants.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

namespace voice_os {

namespace {

bool parse_point(const nlohmann::json& j, Landmark& out) {
    if (j.is_array() && j.size() >= 2) {
        if (!j[0].is_number() || !j[1].is_number()) return false;
        out.x = j[0].get<float>();
        out.y = j[1].get<float>();
        out.z = (j.size() >= 3 && j[2].is_number()) ? j[2].get<float>() : 0.0f;
        return true;
    }
    if (j.is_object() && j.contains("x") && j.contains("y")) {
        if (!j["x"].is_number() || !j["y"].is_number()) return false;
        out.x = j["x"].get<float>();
        out.y = j["y"].get<float>();
        out.z = j.value("z", 0.0f);
        return true;
    }
    return false;
}

} // anonymous namespace

JsonLandmarkStream::JsonLandmarkStream(std::istream& input) : input_(input) {}

std::optional<LandmarkFrame> JsonLandmarkStream::next_frame() {
    std::string line;
    if (!std::getline(input_, line)) {
        LOG_GESTURE("Landmark stream ended after " + std::to_string(line_number_) + " lines");
        return std::nullopt;
    }
    line_number_++;

    if (utils::is_empty_or_whitespace(line)) {
        return LandmarkFrame{};
    }
    auto parsed = parse_line(line);
    if (parsed.is_error()) {
        Logger::warn("[Gesture] Landmark line " + std::to_string(line_number_) + ": " +
                     parsed.error().message);
        return LandmarkFrame{};
    }
    return parsed.value();
}

Result<LandmarkFrame> JsonLandmarkStream::parse_line(const std::string& line) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        return make_parse_error(e.what());
    }

    const nlohmann::json* hands = &j;
    if (j.is_object()) {
        if (!j.contains("hands")) {
            return make_parse_error("missing \"hands\"");
        }
        hands = &j["hands"];
    }
    if (!hands->is_array()) {
        return make_parse_error("hands is not an array");
    }

    LandmarkFrame frame;
    for (const auto& hand_json : *hands) {
        if (!hand_json.is_array() || hand_json.size() != constants::trigger::LANDMARK_COUNT) {
            return make_parse_error("a hand must have " +
                                    std::to_string(constants::trigger::LANDMARK_COUNT) + " points");
        }
        HandLandmarks hand;
        for (size_t i = 0; i < hand.size(); i++) {
            if (!parse_point(hand_json[i], hand[i])) {
                return make_parse_error("bad point " + std::to_string(i));
            }
        }
        frame.push_back(hand);
    }
    return frame;
}

} // namespace voice_os
