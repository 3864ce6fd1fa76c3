/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE PauseManagerTests
#include <boost/test/unit_test.hpp>

#include "core/Canvas.hpp"
#include "core/GameState.hpp"
#include "entities/Ball.hpp"
#include "entities/Paddle.hpp"
#include "managers/PauseManager.hpp"
#include <memory>
#include <vector>

using namespace PongEngine;

struct PauseFixture {
    std::shared_ptr<FixedCanvas> canvas = std::make_shared<FixedCanvas>(800, 600);
    Ball ball{400.0f, 300.0f, canvas};
    Paddle leftPaddle{24.0f, 255.0f, 8.0f, 90.0f, canvas};
    Paddle rightPaddle{768.0f, 255.0f, 8.0f, 90.0f, canvas};
    PauseManager pauseManager{ball, leftPaddle, rightPaddle};
    std::vector<int> announced;

    PauseFixture() {
        pauseManager.setCountdownCallback([this](int seconds) { announced.push_back(seconds); });
    }

    // Serve and run the countdown out
    void startPlaying() {
        pauseManager.resume();
        pauseManager.update(3.0f);
    }
};

BOOST_FIXTURE_TEST_SUITE(PauseFlowTests, PauseFixture)

BOOST_AUTO_TEST_CASE(TestInitialState)
{
    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::PAUSED);
    BOOST_CHECK(pauseManager.isFirstStart());
    BOOST_CHECK(!pauseManager.getSnapshot());
    BOOST_CHECK(!pauseManager.isCountingDown());
}

BOOST_AUTO_TEST_CASE(TestPauseWhilePausedIgnored)
{
    pauseManager.pause();
    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::PAUSED);
    BOOST_CHECK(!pauseManager.getSnapshot());
}

BOOST_AUTO_TEST_CASE(TestFirstResumeServes)
{
    pauseManager.resume();
    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::COUNTDOWN);
    BOOST_CHECK(pauseManager.isCountingDown());
    BOOST_CHECK_CLOSE(pauseManager.getCountdownRemaining(), 3.0f, 0.001f);
    BOOST_CHECK(ball.getVelocity().isZero());

    pauseManager.update(1.5f);
    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::COUNTDOWN);

    pauseManager.update(1.5f);
    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::PLAYING);
    BOOST_CHECK(!pauseManager.isFirstStart());
    BOOST_CHECK_CLOSE(ball.getVelocity().length(), ball.getBaseSpeed(), 0.01f);
}

BOOST_AUTO_TEST_CASE(TestCountdownAnnouncesEachSecond)
{
    pauseManager.startGame();
    pauseManager.update(1.0f);
    pauseManager.update(1.0f);
    pauseManager.update(1.0f);

    const std::vector<int> expected{3, 2, 1, 0};
    BOOST_CHECK_EQUAL_COLLECTIONS(announced.begin(), announced.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestPauseTakesSnapshot)
{
    startPlaying();
    ball.setPosition(Vector2D(200.0f, 150.0f));
    ball.setVelocity(Vector2D(300.0f, 0.0f));
    leftPaddle.setDirection(Direction::DOWN);
    rightPaddle.setDirection(Direction::UP);

    pauseManager.pause();

    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::PAUSED);
    BOOST_REQUIRE(pauseManager.getSnapshot());
    const GameSnapshot& snapshot = *pauseManager.getSnapshot();
    BOOST_CHECK_CLOSE(snapshot.ballState.position.getX(), 0.25f, 0.001f);
    BOOST_CHECK_CLOSE(snapshot.ballState.position.getY(), 0.25f, 0.001f);
    BOOST_CHECK_CLOSE(snapshot.ballState.velocity.getX(), 1.0f, 0.001f);
    BOOST_CHECK_CLOSE(snapshot.leftPaddleRelativeY, 0.5f, 0.001f);
    BOOST_CHECK_CLOSE(snapshot.rightPaddleRelativeY, 0.5f, 0.001f);

    BOOST_CHECK_EQUAL(leftPaddle.getDirection(), Direction::NONE);
    BOOST_CHECK_EQUAL(rightPaddle.getDirection(), Direction::NONE);
}

BOOST_AUTO_TEST_CASE(TestPauseAgainstExplicitSize)
{
    startPlaying();
    ball.setPosition(Vector2D(400.0f, 300.0f));

    pauseManager.pause(1600, 1200);
    BOOST_REQUIRE(pauseManager.getSnapshot());
    BOOST_CHECK_CLOSE(pauseManager.getSnapshot()->ballState.position.getX(), 0.25f, 0.001f);
    BOOST_CHECK_CLOSE(pauseManager.getSnapshot()->leftPaddleRelativeY, 0.25f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestPausedUpdateHoldsSnapshot)
{
    startPlaying();
    ball.setPosition(Vector2D(200.0f, 150.0f));
    ball.setVelocity(Vector2D(300.0f, 0.0f));
    pauseManager.pause();

    ball.setPosition(Vector2D(600.0f, 500.0f));
    leftPaddle.setPosition(24.0f, 0.0f);
    pauseManager.update(0.1f);

    BOOST_CHECK_CLOSE(ball.getPosition().getX(), 200.0f, 0.001f);
    BOOST_CHECK_CLOSE(ball.getPosition().getY(), 150.0f, 0.001f);
    BOOST_CHECK_CLOSE(leftPaddle.getPosition().getY(), 255.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestResumeRestoresSnapshot)
{
    startPlaying();
    ball.setPosition(Vector2D(200.0f, 150.0f));
    ball.setVelocity(Vector2D(300.0f, 0.0f));
    pauseManager.pause();

    pauseManager.resume();
    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::COUNTDOWN);
    BOOST_CHECK(pauseManager.getSnapshot());

    pauseManager.update(3.0f);
    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::PLAYING);
    BOOST_CHECK(!pauseManager.getSnapshot());
    BOOST_CHECK_CLOSE(ball.getPosition().getX(), 200.0f, 0.001f);
    BOOST_CHECK_CLOSE(ball.getPosition().getY(), 150.0f, 0.001f);
    // Direction kept, speed re-derived from the multiplier
    BOOST_CHECK_CLOSE(ball.getVelocity().getX(), ball.getBaseSpeed(), 0.01f);
    BOOST_CHECK_SMALL(ball.getVelocity().getY(), 0.001f);
}

BOOST_AUTO_TEST_CASE(TestPauseDuringCountdownDeferred)
{
    pauseManager.startGame();
    pauseManager.pause();

    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::COUNTDOWN);
    BOOST_CHECK(pauseManager.hasPendingPause());

    pauseManager.update(3.0f);
    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::PAUSED);
    BOOST_CHECK(!pauseManager.hasPendingPause());
    BOOST_CHECK(pauseManager.getSnapshot());
}

BOOST_AUTO_TEST_CASE(TestPointScoredRestartsServe)
{
    startPlaying();
    ball.setPosition(Vector2D(2.0f, 100.0f));

    pauseManager.handlePointScored();

    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::COUNTDOWN);
    BOOST_CHECK(!pauseManager.getSnapshot());
    BOOST_CHECK_CLOSE(ball.getPosition().getX(), 400.0f, 0.001f);
    BOOST_CHECK_CLOSE(ball.getPosition().getY(), 300.0f, 0.001f);
    BOOST_CHECK(ball.getVelocity().isZero());
    BOOST_CHECK(!ball.isDestroyed());

    pauseManager.update(3.0f);
    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::PLAYING);
    BOOST_CHECK(!ball.getVelocity().isZero());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(PauseInterruptTests, PauseFixture)

BOOST_AUTO_TEST_CASE(TestForcePauseKeepsSnapshot)
{
    startPlaying();
    ball.setPosition(Vector2D(200.0f, 150.0f));
    pauseManager.pause();
    pauseManager.resume();
    announced.clear();

    pauseManager.forcePauseFromCountdownKeepSnapshot();

    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::PAUSED);
    BOOST_CHECK(!pauseManager.isCountingDown());
    BOOST_CHECK(pauseManager.getSnapshot());
    BOOST_REQUIRE_EQUAL(announced.size(), 1u);
    BOOST_CHECK_EQUAL(announced[0], 0);
}

BOOST_AUTO_TEST_CASE(TestForcePauseOnlyFromCountdown)
{
    startPlaying();
    pauseManager.forcePauseFromCountdownKeepSnapshot();
    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::PLAYING);
}

BOOST_AUTO_TEST_CASE(TestForceStop)
{
    startPlaying();
    pauseManager.pause();
    pauseManager.resume();

    pauseManager.forceStop();
    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::PAUSED);
    BOOST_CHECK(!pauseManager.getSnapshot());
    BOOST_CHECK(!pauseManager.isCountingDown());

    // Nothing to restore, so the next resume serves
    pauseManager.resume();
    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::COUNTDOWN);
    pauseManager.update(3.0f);
    BOOST_CHECK_CLOSE(ball.getVelocity().length(), ball.getBaseSpeed(), 0.01f);
}

BOOST_AUTO_TEST_CASE(TestUpdateSnapshotPaddles)
{
    pauseManager.updateSnapshotPaddles(0.1f, 0.9f);
    BOOST_CHECK(!pauseManager.getSnapshot());

    startPlaying();
    pauseManager.pause();
    pauseManager.updateSnapshotPaddles(0.1f, 0.9f);
    BOOST_CHECK_CLOSE(pauseManager.getSnapshot()->leftPaddleRelativeY, 0.1f, 0.001f);
    BOOST_CHECK_CLOSE(pauseManager.getSnapshot()->rightPaddleRelativeY, 0.9f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestCleanup)
{
    pauseManager.startGame();
    pauseManager.cleanup();
    announced.clear();

    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::PAUSED);
    BOOST_CHECK(!pauseManager.isCountingDown());

    pauseManager.startGame();
    BOOST_CHECK(announced.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ImmediateCountdownTests)

BOOST_AUTO_TEST_CASE(TestZeroCountdownPlaysAtOnce)
{
    auto canvas = std::make_shared<FixedCanvas>(800, 600);
    PhysicsConfig config;
    config.countdownSeconds = 0.0f;
    Ball ball(400.0f, 300.0f, canvas, config);
    Paddle left(24.0f, 255.0f, 8.0f, 90.0f, canvas);
    Paddle right(768.0f, 255.0f, 8.0f, 90.0f, canvas);
    PauseManager pauseManager(ball, left, right, config);

    pauseManager.startGame();
    BOOST_CHECK_EQUAL(pauseManager.getState(), GameState::PLAYING);
    BOOST_CHECK(!pauseManager.isCountingDown());
    BOOST_CHECK(!ball.getVelocity().isZero());
}

BOOST_AUTO_TEST_SUITE_END()
