#pragma once

#include <glm/glm.hpp>

#include <string>
#include <cstdint>

struct GameView;

//key names (as reported by SDL_GetKeyName) that move each paddle:
struct Controls {
	std::string down[2] = { "S", "Down" };
	std::string up[2] = { "Z", "Up" };
};

//"Game" is the whole state of a two-player pong match plus the rules that advance it.
// Coordinates follow the arena: x grows to the right, y grows downward.
struct Game {
	enum Side : uint8_t {
		Left = 0, //player 1
		Right = 1, //player 2
	};

	glm::vec2 ball = glm::vec2(BallStartX, BallStartY);
	glm::vec2 ball_velocity = glm::vec2(LaunchVelocityX, LaunchVelocityY);

	//paddles are tracked by their top edge; a paddle spans [top, top + PaddleHeight]:
	float paddle_top[2] = { PaddleStartTop, PaddleStartTop };

	uint32_t score[2] = { 0, 0 };

	//advance by one tick:
	// integrate, report ball, reflect off walls, detect goals, collide with paddles
	void update(GameView &view);

	//the stages of update(), in order:
	void integrate();
	void reflect_walls();
	bool detect_goals(GameView &view); //returns true if someone scored
	bool collide_paddles(); //returns true if a paddle was hit

	//send ball back to the center at restart speed:
	void reset_ball();

	//dispatch a key press; returns false (and does nothing) for keys not in 'controls':
	bool handle_key(std::string const &key, Controls const &controls, GameView &view);

	//step a paddle by 'delta' if the result stays within bounds; returns true if it moved:
	bool move_paddle(Side side, float delta, GameView &view);

	//key names match ignoring ASCII case ("s" is the same key as "S"):
	static bool same_key(std::string const &a, std::string const &b);

	//"J1: 3" style label:
	static std::string score_label(Side side, uint32_t score);

	static constexpr const float ArenaWidth = 612.0f;
	static constexpr const float ArenaHeight = 512.0f;

	static constexpr const float BallSize = 5.0f;
	static constexpr const float BallStartX = 306.0f;
	static constexpr const float BallStartY = 256.0f;
	static constexpr const float LaunchVelocityX = 4.0f;
	static constexpr const float LaunchVelocityY = 6.0f;
	static constexpr const float RestartVelocityX = 2.0f;
	static constexpr const float RestartVelocityY = 3.0f;

	static constexpr const float PaddleWidth = 4.0f;
	static constexpr const float PaddleHeight = 80.0f;
	static constexpr const float PaddleLeftX = 12.0f;
	static constexpr const float PaddleRightX = 600.0f;
	static constexpr const float PaddleStartTop = 140.0f;
	static constexpr const float PaddleStep = 25.0f;
	static constexpr const float PaddleMinTop = -25.0f;
	static constexpr const float PaddleMaxTop = 446.0f;

	//thresholds used by the tick (all strict comparisons):
	static constexpr const float WallTop = 10.0f;
	static constexpr const float WallBottom = 486.0f;
	static constexpr const float GoalLeft = 1.0f;
	static constexpr const float GoalRight = 612.0f;
	static constexpr const float HitLeft = 18.0f;
	static constexpr const float HitRight = 592.0f;

	//every paddle hit scales both velocity components by this:
	static constexpr const float SpeedUp = 1.259f;
};

//"GameView" receives everything a display needs to mirror the game.
// Calls happen synchronously from inside Game, so implementations must not block.
struct GameView {
	virtual ~GameView() { }

	//ball bounding box, (x,y) to (x+BallSize,y+BallSize):
	virtual void ball_moved(glm::vec2 const &min, glm::vec2 const &max) = 0;
	virtual void paddle_moved(Game::Side side, float top) = 0;
	virtual void score_changed(Game::Side side, std::string const &label) = 0;
};
