/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/BallState.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>

namespace PongEngine {

JsonValue BallState::toJson() const {
    JsonObject pos;
    pos["x"] = JsonValue(position.getX());
    pos["y"] = JsonValue(position.getY());

    JsonObject vel;
    vel["dx"] = JsonValue(velocity.getX());
    vel["dy"] = JsonValue(velocity.getY());

    JsonObject root;
    root["position"] = JsonValue(std::move(pos));
    root["velocity"] = JsonValue(std::move(vel));
    root["speedMultiplier"] = JsonValue(speedMultiplier);
    return JsonValue(std::move(root));
}

std::optional<BallState> BallState::fromJson(const JsonValue& json) {
    auto x = json["position"]["x"].tryAsFloat();
    auto y = json["position"]["y"].tryAsFloat();
    auto dx = json["velocity"]["dx"].tryAsFloat();
    auto dy = json["velocity"]["dy"].tryAsFloat();
    auto multiplier = json["speedMultiplier"].tryAsFloat();

    if (!x || !y || !dx || !dy || !multiplier) {
        BALL_WARN("Ball state JSON is missing fields");
        return std::nullopt;
    }
    if (!(*x >= 0.0f && *x <= 1.0f && *y >= 0.0f && *y <= 1.0f)) {
        BALL_WARN("Ball state position is not normalised");
        return std::nullopt;
    }
    if (!(*multiplier > 0.0f) || !std::isfinite(*dx) || !std::isfinite(*dy)) {
        BALL_WARN("Ball state velocity or multiplier is invalid");
        return std::nullopt;
    }

    BallState state;
    state.position = Vector2D(*x, *y);
    // Re-normalise: a hand-edited file may not carry an exact unit vector
    state.velocity = Vector2D(*dx, *dy).normalized();
    state.speedMultiplier = *multiplier;
    return state;
}

} // namespace PongEngine
