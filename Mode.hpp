#pragma once

#include <SDL.h>
#include <glm/glm.hpp>

#include <memory>

//"Mode" is whatever currently owns input, simulation and drawing; main() drives Mode::current.
struct Mode : std::enable_shared_from_this< Mode > {
	virtual ~Mode() { }

	//handle_event is called when new mouse or keyboard events are received:
	// (note that this might be many times per frame or never)
	//The function should return 'true' if it handled the event.
	virtual bool handle_event(SDL_Event const &evt, glm::uvec2 const &window_size) { return false; }

	//update is called at the start of a new frame, after events are handled:
	virtual void update(float elapsed) { }

	//draw is called after update:
	virtual void draw(glm::uvec2 const &drawable_size) = 0;

	//Mode::current is the Mode that main() is running; the program quits when it becomes null:
	static std::shared_ptr< Mode > current;
	static void set_current(std::shared_ptr< Mode > const &);
};
