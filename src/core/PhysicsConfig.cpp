/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/PhysicsConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <string>

namespace PongEngine {

PhysicsConfig PhysicsConfig::fromSettings(const SettingsManager& settings) {
    PhysicsConfig config;

    config.timeToCross = settings.get<float>("ball", "time_to_cross", config.timeToCross);
    config.accelerationRate = settings.get<float>("ball", "acceleration_rate", config.accelerationRate);
    config.maxMultiplier = settings.get<float>("ball", "max_multiplier", config.maxMultiplier);
    config.initialMultiplier = settings.get<float>("ball", "initial_multiplier", config.initialMultiplier);
    config.minVelocity = settings.get<float>("ball", "min_velocity", config.minVelocity);
    config.launchAngleBase = settings.get<float>("ball", "launch_angle_base", config.launchAngleBase);
    config.launchAngleVariation = settings.get<float>("ball", "launch_angle_variation", config.launchAngleVariation);
    config.ballSizeRatio = settings.get<float>("ball", "size_ratio", config.ballSizeRatio);
    config.minBallRadius = settings.get<float>("ball", "min_radius", config.minBallRadius);

    config.edgeZoneSize = settings.get<float>("edges", "zone_size", config.edgeZoneSize);
    config.maxDeflection = settings.get<float>("edges", "max_deflection", config.maxDeflection);
    const std::string faceMode = settings.get<std::string>("edges", "top_bottom_deflection", "none");
    if (faceMode == "edge_zone") {
        config.topBottomDeflection = TopBottomDeflection::EdgeZone;
    } else if (faceMode != "none") {
        SETTINGS_WARNING(std::format("Unknown top_bottom_deflection '{}', using 'none'", faceMode));
    }
    config.contactEpsilon = settings.get<float>("edges", "contact_epsilon", config.contactEpsilon);

    config.paddleWidthRatio = settings.get<float>("paddle", "width_ratio", config.paddleWidthRatio);
    config.paddleHeightRatio = settings.get<float>("paddle", "height_ratio", config.paddleHeightRatio);
    config.paddleSpeedRatio = settings.get<float>("paddle", "speed_ratio", config.paddleSpeedRatio);
    config.paddlePaddingRatio = settings.get<float>("paddle", "padding_ratio", config.paddlePaddingRatio);
    config.paddleFreezeSeconds = settings.get<float>("paddle", "freeze_seconds", config.paddleFreezeSeconds);

    config.fixedTimestep = settings.get<float>("loop", "fixed_timestep", config.fixedTimestep);
    config.maxDeltaTime = settings.get<float>("loop", "max_delta_time", config.maxDeltaTime);
    config.maxStepsPerFrame = settings.get<int>("loop", "max_steps_per_frame", config.maxStepsPerFrame);
    config.countdownSeconds = settings.get<float>("loop", "countdown_seconds", config.countdownSeconds);
    config.resizeDebounceSeconds = settings.get<float>("loop", "resize_debounce_seconds", config.resizeDebounceSeconds);

    config.validate();
    return config;
}

bool PhysicsConfig::validate() {
    const PhysicsConfig defaults;
    bool valid = true;

    auto requirePositive = [&valid](float& value, float fallback, const char* name) {
        if (!(value > 0.0f)) {
            SETTINGS_WARNING(std::format("{} must be positive (got {}), using {}", name, value, fallback));
            value = fallback;
            valid = false;
        }
    };

    requirePositive(timeToCross, defaults.timeToCross, "time_to_cross");
    requirePositive(initialMultiplier, defaults.initialMultiplier, "initial_multiplier");
    requirePositive(fixedTimestep, defaults.fixedTimestep, "fixed_timestep");
    requirePositive(maxDeltaTime, defaults.maxDeltaTime, "max_delta_time");
    requirePositive(paddleHeightRatio, defaults.paddleHeightRatio, "paddle height_ratio");
    requirePositive(paddleWidthRatio, defaults.paddleWidthRatio, "paddle width_ratio");
    requirePositive(minBallRadius, defaults.minBallRadius, "min_radius");

    if (maxMultiplier < initialMultiplier) {
        SETTINGS_WARNING(std::format("max_multiplier {} below initial {}, raising", maxMultiplier, initialMultiplier));
        maxMultiplier = initialMultiplier;
        valid = false;
    }
    if (accelerationRate < 0.0f) {
        SETTINGS_WARNING("acceleration_rate cannot be negative, using 0");
        accelerationRate = 0.0f;
        valid = false;
    }
    if (edgeZoneSize < 0.0f || edgeZoneSize > 0.5f) {
        SETTINGS_WARNING(std::format("zone_size {} outside [0, 0.5], clamping", edgeZoneSize));
        edgeZoneSize = std::clamp(edgeZoneSize, 0.0f, 0.5f);
        valid = false;
    }
    if (maxDeflection < 0.0f) {
        maxDeflection = 0.0f;
        valid = false;
    }
    if (maxStepsPerFrame < 1) {
        maxStepsPerFrame = 1;
        valid = false;
    }
    minVelocity = std::max(minVelocity, 0.0f);
    return valid;
}

GameSizes calculateGameSizes(int width, int height, const PhysicsConfig& config) {
    const float w = static_cast<float>(width);
    const float h = static_cast<float>(height);
    const float minDimension = std::min(w, h);

    GameSizes sizes{};
    sizes.paddleWidth = std::floor(w * config.paddleWidthRatio);
    sizes.paddleHeight = std::floor(h * config.paddleHeightRatio);
    sizes.paddleSpeed = std::floor(h * config.paddleSpeedRatio);
    sizes.playerPadding = std::floor(w * config.paddlePaddingRatio);
    sizes.ballRadius = std::max(std::floor(minDimension * config.ballSizeRatio), config.minBallRadius);
    return sizes;
}

} // namespace PongEngine
