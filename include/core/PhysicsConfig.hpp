/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHYSICS_CONFIG_HPP
#define PHYSICS_CONFIG_HPP

#include <cstdint>

namespace PongEngine {

class SettingsManager;

// How TOP/BOTTOM paddle contacts pick a deflection
enum class TopBottomDeflection : uint8_t {
    None,     // face hits reflect without deflection
    EdgeZone  // reuse the front-face edge-zone mapping
};

/**
 * @brief Every tunable of the ball/paddle physics, passed by value
 *
 * Defaults reproduce the shipped game. Nothing in the core reads these from
 * a global; owners hand a copy to Ball, Paddle and the managers.
 */
struct PhysicsConfig {
    // Speed model
    float timeToCross{2.75f};          // seconds for a base-speed ball to cross the canvas width
    float accelerationRate{0.05f};     // multiplier increment per wall/paddle hit
    float maxMultiplier{4.0f};
    float initialMultiplier{1.0f};
    float minVelocity{1.0f};           // pixels/second floor for non-zero velocities

    // Launch
    float launchAngleBase{30.0f};      // degrees from horizontal
    float launchAngleVariation{10.0f}; // +/- degrees

    // Paddle edges
    float edgeZoneSize{0.05f};         // fraction of paddle height at each end
    float maxDeflection{0.1f};         // fraction of PI at the paddle extremes
    TopBottomDeflection topBottomDeflection{TopBottomDeflection::None};

    // Contact resolution
    float contactEpsilon{0.03f};       // pixels pushed out past a contact point

    // Sizing ratios (fractions of the canvas)
    float paddleWidthRatio{0.01f};
    float paddleHeightRatio{0.15f};
    float paddleSpeedRatio{1.2f};      // canvas heights per second
    float paddlePaddingRatio{0.03f};
    float ballSizeRatio{0.008f};       // of the smaller canvas dimension
    float minBallRadius{5.0f};
    float paddleFreezeSeconds{0.2f};   // after a top/bottom contact

    // Fixed-step loop
    float fixedTimestep{0.01f};        // seconds per physics sub-step
    float maxDeltaTime{0.1f};          // frame delta clamp, seconds
    int maxStepsPerFrame{8};

    // Match flow
    float countdownSeconds{3.0f};
    float resizeDebounceSeconds{0.05f};

    /**
     * @brief Builds a config from the "ball", "paddle", "edges" and "loop"
     * categories, falling back to the defaults above for missing keys
     */
    static PhysicsConfig fromSettings(const SettingsManager& settings);

    /**
     * @brief Repairs inconsistent values in place (logs each fix)
     * @return true if the config was already valid
     */
    bool validate();
};

// Canvas-derived sizes, all in pixels (speed in pixels/second)
struct GameSizes {
    float paddleWidth;
    float paddleHeight;
    float paddleSpeed;
    float playerPadding;
    float ballRadius;
};

GameSizes calculateGameSizes(int width, int height, const PhysicsConfig& config);

} // namespace PongEngine

#endif // PHYSICS_CONFIG_HPP
