/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BALL_STATE_HPP
#define BALL_STATE_HPP

#include "utils/Vector2D.hpp"
#include <optional>

namespace PongEngine {

class JsonValue;

/**
 * @brief Resolution-independent ball snapshot
 *
 * position is normalised by the canvas size ([0,1] on each axis), velocity
 * is a unit direction (or zero for a stationary ball) and the speed is kept
 * as the multiplier so the snapshot can be replayed at any resolution.
 * Only used across resize/pause; never authoritative during play.
 */
struct BallState {
    Vector2D position{0.0f, 0.0f};
    Vector2D velocity{0.0f, 0.0f};
    float speedMultiplier{1.0f};

    // {"position":{"x":..,"y":..},"velocity":{"dx":..,"dy":..},"speedMultiplier":..}
    JsonValue toJson() const;

    /**
     * @brief Parses the toJson() shape
     * @return nullopt on missing or mistyped fields, positions outside
     *         [0,1] or a non-positive multiplier
     */
    static std::optional<BallState> fromJson(const JsonValue& json);
};

} // namespace PongEngine

#endif // BALL_STATE_HPP
