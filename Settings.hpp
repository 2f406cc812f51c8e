#pragma once

#include "Game.hpp"

#include <glm/glm.hpp>

#include <iosfwd>
#include <string>

//"Settings" collects everything about a run that can be changed without recompiling:
struct Settings {
	float tick_period = 0.05f; //seconds between Game::update calls
	Controls controls;
	std::string window_title = "Pong x64";
	glm::uvec2 window_size = glm::uvec2(712, 512);

	//read settings from a file of 'key value' lines, starting from the defaults.
	// note: will throw on malformed lines; unknown keys only warn.
	static Settings load(std::string const &filename);

	//same, from an already-open stream ('name' is used in messages):
	static Settings parse(std::istream &in, std::string const &name);
};
