#include "Settings.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {
	//shorter ticks would run more updates per frame than the Ticker will deliver:
	float const MinTickMs = 1.0f;

	std::string trim(std::string const &s) {
		size_t begin = s.find_first_not_of(" \t\r");
		if (begin == std::string::npos) return "";
		size_t end = s.find_last_not_of(" \t\r");
		return s.substr(begin, end - begin + 1);
	}
}

Settings Settings::load(std::string const &filename) {
	std::ifstream file(filename);
	if (!file) {
		throw std::runtime_error("Failed to open settings file '" + filename + "'.");
	}
	return parse(file, filename);
}

Settings Settings::parse(std::istream &in, std::string const &name) {
	Settings settings;

	uint32_t line_number = 0;
	auto fail = [&](std::string const &message) {
		throw std::runtime_error(name + ":" + std::to_string(line_number) + ": " + message);
	};

	//numbers must use the whole value:
	auto read_float = [&](std::string const &value) {
		std::istringstream str(value);
		float ret = 0.0f;
		char extra;
		if (!(str >> ret) || (str >> extra)) fail("expected a number, got '" + value + "'");
		if (!(ret > 0.0f)) fail("expected a positive number, got '" + value + "'");
		return ret;
	};
	auto read_size = [&](std::string const &value) {
		std::istringstream str(value);
		int w = 0, h = 0;
		char extra;
		if (!(str >> w >> h) || (str >> extra)) fail("expected 'width height', got '" + value + "'");
		if (w <= 0 || h <= 0) fail("window size must be positive, got '" + value + "'");
		return glm::uvec2(uint32_t(w), uint32_t(h));
	};

	//where each binding was set, for collision messages:
	uint32_t binding_lines[4] = { 0, 0, 0, 0 };
	std::string *bindings[4] = {
		&settings.controls.down[Game::Left], &settings.controls.up[Game::Left],
		&settings.controls.down[Game::Right], &settings.controls.up[Game::Right],
	};
	char const *binding_keys[4] = { "p1_down", "p1_up", "p2_down", "p2_up" };

	std::string line;
	while (std::getline(in, line)) {
		++line_number;
		size_t comment = line.find('#');
		if (comment != std::string::npos) line = line.substr(0, comment);
		line = trim(line);
		if (line.empty()) continue;

		size_t split = line.find_first_of(" \t");
		std::string key = line.substr(0, split);
		std::string value = (split == std::string::npos ? "" : trim(line.substr(split)));
		if (value.empty()) fail("missing value for '" + key + "'");

		if (key == "tick_ms") {
			float ms = read_float(value);
			if (ms < MinTickMs) fail("tick_ms must be at least " + std::to_string(int(MinTickMs)) + ", got '" + value + "'");
			settings.tick_period = ms / 1000.0f;
		} else if (key == "window_title") {
			settings.window_title = value;
		} else if (key == "window_size") {
			settings.window_size = read_size(value);
		} else {
			bool found = false;
			for (uint32_t b = 0; b < 4; ++b) {
				if (key == binding_keys[b]) {
					*bindings[b] = value;
					binding_lines[b] = line_number;
					found = true;
				}
			}
			if (!found) {
				std::cerr << "WARNING: " << name << ":" << line_number << ": ignoring unknown setting '" << key << "'." << std::endl;
			}
		}
	}
	if (in.bad()) {
		throw std::runtime_error("Failed to read settings from '" + name + "'.");
	}

	//a key can only drive one action:
	for (uint32_t a = 0; a < 4; ++a) {
		for (uint32_t b = a + 1; b < 4; ++b) {
			if (Game::same_key(*bindings[a], *bindings[b])) {
				line_number = std::max(binding_lines[a], binding_lines[b]);
				fail("key '" + *bindings[a] + "' is bound to both '" + binding_keys[a] + "' and '" + binding_keys[b] + "'");
			}
		}
	}

	return settings;
}
