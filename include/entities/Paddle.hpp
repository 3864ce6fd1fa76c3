/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PADDLE_HPP
#define PADDLE_HPP

#include "collisions/BoundingBox.hpp"
#include "core/PhysicsConfig.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <memory>
#include <ostream>

namespace PongEngine {

class Canvas;

enum class Direction : uint8_t {
    UP,
    DOWN,
    NONE
};

inline std::ostream& operator<<(std::ostream& os, Direction direction) {
    switch (direction) {
    case Direction::UP:
        return os << "UP";
    case Direction::DOWN:
        return os << "DOWN";
    case Direction::NONE:
        return os << "NONE";
    }
    return os << "UNKNOWN";
}

/**
 * @brief Vertically moving paddle
 *
 * (x, y) is the top-left corner in pixels. Speed is in pixels/second and
 * derives from the canvas height. Invariant after every movement or
 * resize: y in [0, canvasHeight - height].
 */
class Paddle {
public:
    /**
     * @throws std::invalid_argument if canvas is null
     */
    Paddle(float x, float y, float width, float height, std::shared_ptr<const Canvas> canvas,
           const PhysicsConfig& config = PhysicsConfig{});

    void setDirection(Direction direction) { m_direction = direction; }
    Direction getDirection() const { return m_direction; }

    /**
     * @brief Advances y by direction * speed * deltaTime, clamped to the canvas
     *
     * The previous position is always recorded. A frozen paddle only counts
     * its freeze timer down.
     */
    void updateMovement(float deltaTime);

    // Instantaneous velocity implied by the direction; zero when NONE or frozen
    Vector2D getVelocity() const;

    Vector2D getPosition() const { return Vector2D(m_x, m_y); }
    Vector2D getPreviousPosition() const { return Vector2D(m_prevX, m_prevY); }
    Vector2D getInterpolatedPosition(float alpha) const;
    BoundingBox getBoundingBox() const { return BoundingBox::fromRect(m_x, m_y, m_width, m_height); }

    float getWidth() const { return m_width; }
    float getHeight() const { return m_height; }
    float getSpeed() const { return m_speed; }

    // Paddle centre as a fraction of the canvas height
    float getRelativeCenterY() const;
    float getRelativeCenterY(int canvasHeight) const;
    void setRelativeCenterY(float relativeY);

    void updateDimensions(float width, float height);

    // Re-derives width, height and speed from the canvas, then clamps
    void updateSizes();

    void setPosition(float x, float y);
    void setX(float x) { m_x = x; m_prevX = x; }
    void clampToCanvas();

    // Direction NONE and the previous position synced to the current one
    void stop();

    // Ignore the direction for the given time (after a top/bottom contact)
    void freezeMovement(float seconds);
    bool isFrozen() const { return m_freezeRemaining > 0.0f; }

    const Canvas& getCanvas() const { return *m_canvas; }

private:
    std::shared_ptr<const Canvas> m_canvas;
    PhysicsConfig m_config;

    float m_x;
    float m_y;
    float m_prevX;
    float m_prevY;
    float m_width;
    float m_height;
    float m_speed{0.0f};
    float m_freezeRemaining{0.0f};
    Direction m_direction{Direction::NONE};
};

} // namespace PongEngine

#endif // PADDLE_HPP
