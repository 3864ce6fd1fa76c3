/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Paddle.hpp"
#include "core/Canvas.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace PongEngine {

Paddle::Paddle(float x, float y, float width, float height, std::shared_ptr<const Canvas> canvas,
               const PhysicsConfig& config)
    : m_canvas(std::move(canvas))
    , m_config(config)
    , m_x(x)
    , m_y(y)
    , m_prevX(x)
    , m_prevY(y)
    , m_width(width)
    , m_height(height)
{
    if (!m_canvas) {
        throw std::invalid_argument("Paddle requires a canvas");
    }
    m_speed = calculateGameSizes(m_canvas->getWidth(), m_canvas->getHeight(), m_config).paddleSpeed;
}

void Paddle::updateMovement(float deltaTime) {
    m_prevX = m_x;
    m_prevY = m_y;

    if (m_freezeRemaining > 0.0f) {
        m_freezeRemaining = std::max(m_freezeRemaining - deltaTime, 0.0f);
        return;
    }
    if (m_direction == Direction::NONE) {
        return;
    }

    const float frameSpeed = m_speed * deltaTime;
    const float newY = m_direction == Direction::UP ? m_y - frameSpeed : m_y + frameSpeed;
    const float maxY = std::max(static_cast<float>(m_canvas->getHeight()) - m_height, 0.0f);
    m_y = std::clamp(newY, 0.0f, maxY);
}

Vector2D Paddle::getVelocity() const {
    if (m_freezeRemaining > 0.0f) {
        return Vector2D(0.0f, 0.0f);
    }
    switch (m_direction) {
    case Direction::UP:
        return Vector2D(0.0f, -m_speed);
    case Direction::DOWN:
        return Vector2D(0.0f, m_speed);
    case Direction::NONE:
        break;
    }
    return Vector2D(0.0f, 0.0f);
}

Vector2D Paddle::getInterpolatedPosition(float alpha) const {
    return Vector2D(m_prevX + (m_x - m_prevX) * alpha, m_prevY + (m_y - m_prevY) * alpha);
}

float Paddle::getRelativeCenterY() const {
    return getRelativeCenterY(m_canvas->getHeight());
}

float Paddle::getRelativeCenterY(int canvasHeight) const {
    if (canvasHeight <= 0) {
        return 0.5f;
    }
    return (m_y + m_height * 0.5f) / static_cast<float>(canvasHeight);
}

void Paddle::setRelativeCenterY(float relativeY) {
    m_y = relativeY * static_cast<float>(m_canvas->getHeight()) - m_height * 0.5f;
    clampToCanvas();
    m_prevY = m_y;
}

void Paddle::updateDimensions(float width, float height) {
    m_width = width;
    m_height = height;
    clampToCanvas();
}

void Paddle::updateSizes() {
    const int width = m_canvas->getWidth();
    const int height = m_canvas->getHeight();
    if (width <= 0 || height <= 0) {
        PADDLE_WARN(std::format("Ignoring size update for {}x{} canvas", width, height));
        return;
    }

    const GameSizes sizes = calculateGameSizes(width, height, m_config);
    m_width = sizes.paddleWidth;
    m_height = sizes.paddleHeight;
    m_speed = sizes.paddleSpeed;
    clampToCanvas();
}

void Paddle::setPosition(float x, float y) {
    m_x = x;
    m_y = y;
    clampToCanvas();
}

void Paddle::clampToCanvas() {
    const float maxY = std::max(static_cast<float>(m_canvas->getHeight()) - m_height, 0.0f);
    m_y = std::clamp(m_y, 0.0f, maxY);
}

void Paddle::stop() {
    m_direction = Direction::NONE;
    m_prevX = m_x;
    m_prevY = m_y;
}

void Paddle::freezeMovement(float seconds) {
    m_freezeRemaining = std::max(m_freezeRemaining, seconds);
}

} // namespace PongEngine
