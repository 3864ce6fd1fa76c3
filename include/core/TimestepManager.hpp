/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>
#include <cstdint>

namespace PongEngine {

/**
 * TimestepManager splits each rendered frame into fixed physics sub-steps.
 *
 * The frame delta is clamped to maxDeltaTime and accumulated; shouldUpdate()
 * then hands out fixed steps until the accumulator is drained or
 * maxStepsPerFrame is reached. Time left over beyond the step cap is dropped
 * so a stall never turns into a catch-up burst, and the swept collision test
 * never sees more than one fixed step of movement at a time.
 */
class TimestepManager {
public:
    /**
     * Constructor
     * @param targetFPS Target frames per second for rendering (e.g., 60.0f)
     * @param fixedTimestep Fixed timestep for updates in seconds (e.g., 0.01f)
     * @param maxDeltaTime Largest frame delta accepted, in seconds
     * @param maxStepsPerFrame Upper bound on fixed updates per frame
     */
    explicit TimestepManager(float targetFPS = 60.0f, float fixedTimestep = 0.01f,
                             float maxDeltaTime = 0.1f, int maxStepsPerFrame = 8);

    /**
     * Call this at the start of each frame; measures the frame delta itself
     */
    void startFrame();

    /**
     * Starts a frame with an externally measured delta (seconds)
     */
    void startFrame(double frameSeconds);

    /**
     * Returns true if an update should be performed with fixed timestep.
     * May return true multiple times per frame for catch-up, never more
     * than maxStepsPerFrame times.
     * @return true if update should run
     */
    bool shouldUpdate();

    /**
     * Returns true if rendering should be performed.
     * Typically once per frame.
     */
    bool shouldRender() const;

    /**
     * Gets the fixed delta time for updates.
     * @return fixed timestep in seconds
     */
    float getUpdateDeltaTime() const;

    /**
     * Gets the interpolation factor (alpha) for smooth rendering between fixed updates.
     * @return accumulator / fixed step, clamped to [0, 1]
     */
    double getInterpolationAlpha() const;

    /**
     * Call this at the end of each frame.
     * Handles frame rate limiting via SDL_DelayPrecise when software limiting is on.
     */
    void endFrame();

    float getCurrentFPS() const;
    float getTargetFPS() const;
    uint32_t getFrameTimeMs() const;

    // Fixed updates handed out since the last startFrame()
    int getStepsThisFrame() const { return m_stepsThisFrame; }
    int getMaxStepsPerFrame() const { return m_maxStepsPerFrame; }
    float getMaxDeltaTime() const { return m_maxDeltaTime; }

    void setTargetFPS(float fps);
    void setFixedTimestep(float timestep);
    void setMaxDeltaTime(float seconds);
    void setMaxStepsPerFrame(int steps);

    /**
     * Reset timing state (pause/resume, resize)
     */
    void reset();

    /**
     * Explicitly set software frame limiting mode (used when VSync is unavailable)
     */
    void setSoftwareFrameLimiting(bool useSoftwareLimiting);
    bool isUsingSoftwareFrameLimiting() const { return m_usingSoftwareFrameLimiting; }

private:
    void accumulate(double deltaSeconds);
    void updateFPS();
    void limitFrameRate() const;

    // Timing configuration
    float m_targetFPS;
    float m_fixedTimestep;
    float m_targetFrameTime;
    float m_maxDeltaTime;
    int m_maxStepsPerFrame;

    std::chrono::high_resolution_clock::time_point m_frameStart;
    std::chrono::high_resolution_clock::time_point m_lastFrameTime;

    double m_accumulator{0.0};
    int m_stepsThisFrame{0};

    // Frame statistics
    uint32_t m_lastFrameTimeMs{0};
    double m_lastDeltaSeconds{0.0};
    float m_currentFPS{0.0f};
    float m_smoothingAlpha{0.03f};     // EMA smoothing factor

    bool m_shouldRender{true};
    bool m_firstFrame{true};
    bool m_usingSoftwareFrameLimiting{false};
};

} // namespace PongEngine

#endif // TIMESTEP_MANAGER_HPP
