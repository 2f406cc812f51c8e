#include "Game.hpp"

#include <cctype>

//out-of-line definitions so the constants can be bound to references:
constexpr const float Game::ArenaWidth;
constexpr const float Game::ArenaHeight;
constexpr const float Game::BallSize;
constexpr const float Game::BallStartX;
constexpr const float Game::BallStartY;
constexpr const float Game::LaunchVelocityX;
constexpr const float Game::LaunchVelocityY;
constexpr const float Game::RestartVelocityX;
constexpr const float Game::RestartVelocityY;
constexpr const float Game::PaddleWidth;
constexpr const float Game::PaddleHeight;
constexpr const float Game::PaddleLeftX;
constexpr const float Game::PaddleRightX;
constexpr const float Game::PaddleStartTop;
constexpr const float Game::PaddleStep;
constexpr const float Game::PaddleMinTop;
constexpr const float Game::PaddleMaxTop;
constexpr const float Game::WallTop;
constexpr const float Game::WallBottom;
constexpr const float Game::GoalLeft;
constexpr const float Game::GoalRight;
constexpr const float Game::HitLeft;
constexpr const float Game::HitRight;
constexpr const float Game::SpeedUp;

void Game::update(GameView &view) {
	integrate();
	view.ball_moved(ball, ball + glm::vec2(BallSize, BallSize));

	//the stages below must stay in this order: a goal resets the ball,
	// which is what keeps the paddle check from also firing on the same tick.
	reflect_walls();
	detect_goals(view);
	collide_paddles();
}

void Game::integrate() {
	ball += ball_velocity;
}

void Game::reflect_walls() {
	//strict: a ball exactly on 10 or 486 is not reflected.
	if (ball.y < WallTop) {
		ball_velocity.y = -ball_velocity.y;
	} else if (ball.y > WallBottom) {
		ball_velocity.y = -ball_velocity.y;
	}
}

bool Game::detect_goals(GameView &view) {
	Side scorer;
	if (ball.x < GoalLeft) {
		scorer = Right;
	} else if (ball.x > GoalRight) {
		scorer = Left;
	} else {
		return false;
	}

	score[scorer] += 1;
	ball_velocity.x = -ball_velocity.x;
	reset_ball();
	view.score_changed(scorer, score_label(scorer, score[scorer]));
	return true;
}

bool Game::collide_paddles() {
	auto in_paddle = [this](Side side) {
		return paddle_top[side] < ball.y && ball.y < paddle_top[side] + PaddleHeight;
	};

	if ((ball.x < HitLeft && in_paddle(Left)) || (ball.x > HitRight && in_paddle(Right))) {
		ball_velocity.x = -ball_velocity.x;
		ball_velocity *= SpeedUp;
		return true;
	}
	return false;
}

void Game::reset_ball() {
	ball = glm::vec2(BallStartX, BallStartY);
	ball_velocity = glm::vec2(RestartVelocityX, RestartVelocityY);
}

bool Game::handle_key(std::string const &key, Controls const &controls, GameView &view) {
	for (uint32_t i = 0; i < 2; ++i) {
		Side side = Side(i);
		if (same_key(key, controls.down[side])) {
			move_paddle(side, PaddleStep, view);
			return true;
		} else if (same_key(key, controls.up[side])) {
			move_paddle(side, -PaddleStep, view);
			return true;
		}
	}
	return false;
}

bool Game::move_paddle(Side side, float delta, GameView &view) {
	//only the bound in the direction of travel is checked:
	float top = paddle_top[side] + delta;
	if (delta > 0.0f && top > PaddleMaxTop) return false;
	if (delta < 0.0f && top < PaddleMinTop) return false;

	paddle_top[side] = top;
	view.paddle_moved(side, top);
	return true;
}

bool Game::same_key(std::string const &a, std::string const &b) {
	if (a.size() != b.size()) return false;
	for (size_t i = 0; i < a.size(); ++i) {
		if (std::toupper(static_cast< unsigned char >(a[i])) != std::toupper(static_cast< unsigned char >(b[i]))) return false;
	}
	return true;
}

std::string Game::score_label(Side side, uint32_t score) {
	return "J" + std::to_string(uint32_t(side) + 1) + ": " + std::to_string(score);
}
