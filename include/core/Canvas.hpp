/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CANVAS_HPP
#define CANVAS_HPP

namespace PongEngine {

/**
 * @brief Drawing surface dimensions as seen by the physics core
 *
 * The render layer owns the real surface (an SDL window in the demo); the
 * core only ever asks for its current pixel size.
 */
class Canvas {
public:
    virtual ~Canvas() = default;

    virtual int getWidth() const = 0;
    virtual int getHeight() const = 0;
};

// Plain settable canvas for headless simulation and tests
class FixedCanvas : public Canvas {
public:
    FixedCanvas(int width, int height) : m_width(width), m_height(height) {}

    int getWidth() const override { return m_width; }
    int getHeight() const override { return m_height; }

    void resize(int width, int height) {
        m_width = width;
        m_height = height;
    }

private:
    int m_width;
    int m_height;
};

} // namespace PongEngine

#endif // CANVAS_HPP
