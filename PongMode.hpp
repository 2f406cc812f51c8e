#pragma once

#include "Mode.hpp"

#include "Game.hpp"
#include "Settings.hpp"
#include "Ticker.hpp"

#include <SDL.h>
#include <glm/glm.hpp>

#include <string>

// The 'PongMode' mode runs a two-player match and draws whatever the game reports to it:

struct PongMode : public Mode, public GameView {
	PongMode(Settings const &settings, SDL_Window *window);
	virtual ~PongMode();

	//Mode:
	virtual bool handle_event(SDL_Event const &evt, glm::uvec2 const &window_size) override;
	virtual void update(float elapsed) override;
	virtual void draw(glm::uvec2 const &drawable_size) override;

	//GameView:
	virtual void ball_moved(glm::vec2 const &min, glm::vec2 const &max) override;
	virtual void paddle_moved(Game::Side side, float top) override;
	virtual void score_changed(Game::Side side, std::string const &label) override;

	//------- game state -------

	Game game;
	Controls controls;
	Ticker ticker;

	//------- display state (as last reported through GameView) -------

	glm::vec2 ball_min = glm::vec2(0.0f);
	glm::vec2 ball_max = glm::vec2(0.0f);
	float paddle_top[2] = { 0.0f, 0.0f };
	std::string score_labels[2];

	SDL_Window *window = nullptr; //not owned; title shows the score
	std::string title;
	void update_title();

	//score labels sit in margins this wide on either side of the arena:
	static constexpr const float Margin = 50.0f;
};
