#include "PongMode.hpp"

#include "Load.hpp"
#include "gl_errors.hpp" //helper for dumpping OpenGL error messages
#include "color_program.hpp"

#include <glm/gtc/type_ptr.hpp>

#include <algorithm>
#include <iostream>
#include <vector>

//---------- resources ------------

//unit square as two triangles; every rectangle on screen is this, scaled and moved:
Load< GLuint > quad_buffer(LoadTagDefault, [](){
	std::vector< glm::vec2 > const data{
		glm::vec2(0.0f, 0.0f), glm::vec2(1.0f, 0.0f), glm::vec2(1.0f, 1.0f),
		glm::vec2(0.0f, 0.0f), glm::vec2(1.0f, 1.0f), glm::vec2(0.0f, 1.0f),
	};
	GLuint *ret = new GLuint(0);
	glGenBuffers(1, ret);
	glBindBuffer(GL_ARRAY_BUFFER, *ret);
	glBufferData(GL_ARRAY_BUFFER, data.size() * sizeof(glm::vec2), data.data(), GL_STATIC_DRAW);
	glBindBuffer(GL_ARRAY_BUFFER, 0);
	GL_ERRORS();
	return ret;
});

//Binding for using color_program on quad_buffer:
Load< GLuint > quad_binding(LoadTagDefault, [](){
	GLuint *ret = new GLuint(0);
	glGenVertexArrays(1, ret);
	glBindVertexArray(*ret);
	glBindBuffer(GL_ARRAY_BUFFER, *quad_buffer);
	glVertexAttribPointer(color_program->Position_vec2, 2, GL_FLOAT, GL_FALSE, sizeof(glm::vec2), (GLbyte *)0);
	glEnableVertexAttribArray(color_program->Position_vec2);
	glBindBuffer(GL_ARRAY_BUFFER, 0);
	glBindVertexArray(0);
	GL_ERRORS();
	return ret;
});

//----------------------

constexpr const float PongMode::Margin;

namespace {
	glm::vec4 const Black = glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
	glm::vec4 const White = glm::vec4(1.0f, 1.0f, 1.0f, 1.0f);
	glm::vec4 const Cyan = glm::vec4(0.0f, 0.93f, 0.93f, 1.0f);
	glm::vec4 const Red = glm::vec4(1.0f, 0.0f, 0.0f, 1.0f);
	glm::vec4 const Backdrop = glm::vec4(0.85f, 0.85f, 0.85f, 1.0f);

	//dashed center line, as (top, bottom) spans at x 305..307:
	float const CenterLine[6][2] = {
		{ 0.0f, 65.0f }, { 85.0f, 150.0f }, { 170.0f, 235.0f },
		{ 255.0f, 320.0f }, { 340.0f, 405.0f }, { 426.0f, 512.0f },
	};

	//score labels use a small seven-segment face:
	float const GlyphWidth = 6.0f;
	float const GlyphHeight = 12.0f;
	float const GlyphStroke = 1.5f;
	float const GlyphSpacing = 2.0f;
	float const LabelPadding = 3.0f;
	float const LabelTop = 10.0f;

	//segment bits: a=1 (top), b=2, c=4 (right), d=8 (bottom), e=16, f=32 (left), g=64 (middle)
	uint8_t const DigitSegments[10] = { 63, 6, 91, 79, 102, 109, 125, 7, 127, 111 };
	uint8_t const JSegments = 30;

	float glyph_width(char c) {
		if (c == ':') return GlyphStroke;
		if (c == ' ') return 0.5f * GlyphWidth;
		return GlyphWidth;
	}

	float label_width(std::string const &label) {
		float width = 0.0f;
		for (uint32_t i = 0; i < label.size(); ++i) {
			if (i > 0) width += GlyphSpacing;
			width += glyph_width(label[i]);
		}
		return width;
	}
}

PongMode::PongMode(Settings const &settings, SDL_Window *window_) : controls(settings.controls), ticker(settings.tick_period), window(window_), title(settings.window_title) {
	ball_min = game.ball;
	ball_max = game.ball + glm::vec2(Game::BallSize, Game::BallSize);
	for (uint32_t i = 0; i < 2; ++i) {
		paddle_top[i] = game.paddle_top[i];
		score_labels[i] = Game::score_label(Game::Side(i), game.score[i]);
	}
	update_title();
}

PongMode::~PongMode() {
}

void PongMode::update_title() {
	if (!window) return;
	SDL_SetWindowTitle(window, (title + " | " + score_labels[Game::Left] + " | " + score_labels[Game::Right]).c_str());
}

bool PongMode::handle_event(SDL_Event const &evt, glm::uvec2 const &window_size) {
	if (evt.type != SDL_KEYDOWN) return false;

	if (evt.key.keysym.sym == SDLK_ESCAPE) {
		Mode::set_current(nullptr);
		return true;
	}

	//key repeat is passed through, so holding a key keeps stepping the paddle:
	return game.handle_key(SDL_GetKeyName(evt.key.keysym.sym), controls, *this);
}

void PongMode::update(float elapsed) {
	for (uint32_t ticks = ticker.advance(elapsed); ticks > 0; --ticks) {
		game.update(*this);
	}
}

void PongMode::ball_moved(glm::vec2 const &min, glm::vec2 const &max) {
	ball_min = min;
	ball_max = max;
}

void PongMode::paddle_moved(Game::Side side, float top) {
	paddle_top[side] = top;
}

void PongMode::score_changed(Game::Side side, std::string const &label) {
	score_labels[side] = label;
	std::cout << label << std::endl;
	update_title();
}

void PongMode::draw(glm::uvec2 const &drawable_size) {
	//everything is laid out in a 'view' space of arena plus margins, y pointing down:
	glm::vec2 view_size = glm::vec2(Game::ArenaWidth + 2.0f * Margin, Game::ArenaHeight);

	//letterbox: largest uniform scale that fits the view in the drawable:
	float scale = std::min(drawable_size.x / view_size.x, drawable_size.y / view_size.y);
	glm::vec2 to_clip = 2.0f * scale / glm::vec2(drawable_size);
	glm::mat4 view_to_clip = glm::mat4(
		glm::vec4(to_clip.x, 0.0f, 0.0f, 0.0f),
		glm::vec4(0.0f, -to_clip.y, 0.0f, 0.0f),
		glm::vec4(0.0f, 0.0f, 1.0f, 0.0f),
		glm::vec4(-0.5f * view_size.x * to_clip.x, 0.5f * view_size.y * to_clip.y, 0.0f, 1.0f)
	);

	glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
	glClear(GL_COLOR_BUFFER_BIT);
	glDisable(GL_DEPTH_TEST);

	glUseProgram(color_program->program);
	glBindVertexArray(*quad_binding);

	auto draw_rect = [&](glm::vec2 const &min, glm::vec2 const &max, glm::vec4 const &color, bool rounded = false) {
		glm::mat4 object_to_clip = view_to_clip * glm::mat4(
			glm::vec4(max.x - min.x, 0.0f, 0.0f, 0.0f),
			glm::vec4(0.0f, max.y - min.y, 0.0f, 0.0f),
			glm::vec4(0.0f, 0.0f, 1.0f, 0.0f),
			glm::vec4(min.x, min.y, 0.0f, 1.0f)
		);
		glUniformMatrix4fv(color_program->object_to_clip_mat4, 1, GL_FALSE, glm::value_ptr(object_to_clip));
		glUniform4fv(color_program->color_vec4, 1, glm::value_ptr(color));
		glUniform1i(color_program->rounded_bool, rounded ? 1 : 0);
		glDrawArrays(GL_TRIANGLES, 0, 6);
	};

	//arena-space rectangle, shifted past the left margin:
	glm::vec2 arena = glm::vec2(Margin, 0.0f);
	auto draw_arena_rect = [&](glm::vec2 const &min, glm::vec2 const &max, glm::vec4 const &color, bool rounded = false) {
		draw_rect(arena + min, arena + max, color, rounded);
	};

	auto draw_label = [&](std::string const &label, float center_x) {
		float width = label_width(label);
		float x = center_x - 0.5f * width;
		draw_rect(glm::vec2(x - LabelPadding, LabelTop - LabelPadding), glm::vec2(x + width + LabelPadding, LabelTop + GlyphHeight + LabelPadding), Cyan);

		float const t = GlyphStroke;
		float const w = GlyphWidth;
		float const h = GlyphHeight;
		float const y = LabelTop;
		for (uint32_t i = 0; i < label.size(); ++i) {
			char c = label[i];
			if (i > 0) x += GlyphSpacing;
			if (c == ':') {
				draw_rect(glm::vec2(x, y + 0.25f * h), glm::vec2(x + t, y + 0.25f * h + t), Red);
				draw_rect(glm::vec2(x, y + 0.75f * h - t), glm::vec2(x + t, y + 0.75f * h), Red);
			} else {
				uint8_t segments = 0;
				if (c >= '0' && c <= '9') segments = DigitSegments[c - '0'];
				else if (c == 'J') segments = JSegments;

				if (segments & 1) draw_rect(glm::vec2(x, y), glm::vec2(x + w, y + t), Red);
				if (segments & 2) draw_rect(glm::vec2(x + w - t, y), glm::vec2(x + w, y + 0.5f * h), Red);
				if (segments & 4) draw_rect(glm::vec2(x + w - t, y + 0.5f * h), glm::vec2(x + w, y + h), Red);
				if (segments & 8) draw_rect(glm::vec2(x, y + h - t), glm::vec2(x + w, y + h), Red);
				if (segments & 16) draw_rect(glm::vec2(x, y + 0.5f * h), glm::vec2(x + t, y + h), Red);
				if (segments & 32) draw_rect(glm::vec2(x, y), glm::vec2(x + t, y + 0.5f * h), Red);
				if (segments & 64) draw_rect(glm::vec2(x, y + 0.5f * (h - t)), glm::vec2(x + w, y + 0.5f * (h + t)), Red);
			}
			x += glyph_width(c);
		}
	};

	//margins, then the arena over them:
	draw_rect(glm::vec2(0.0f), view_size, Backdrop);
	draw_arena_rect(glm::vec2(0.0f), glm::vec2(Game::ArenaWidth, Game::ArenaHeight), Black);

	for (auto const &span : CenterLine) {
		draw_arena_rect(glm::vec2(305.0f, span[0]), glm::vec2(307.0f, span[1]), White);
	}

	draw_arena_rect(glm::vec2(Game::PaddleLeftX, paddle_top[Game::Left]), glm::vec2(Game::PaddleLeftX + Game::PaddleWidth, paddle_top[Game::Left] + Game::PaddleHeight), White);
	draw_arena_rect(glm::vec2(Game::PaddleRightX, paddle_top[Game::Right]), glm::vec2(Game::PaddleRightX + Game::PaddleWidth, paddle_top[Game::Right] + Game::PaddleHeight), White);

	draw_arena_rect(ball_min, ball_max, Cyan, true);

	draw_label(score_labels[Game::Left], 0.5f * Margin);
	draw_label(score_labels[Game::Right], view_size.x - 0.5f * Margin);

	glBindVertexArray(0);
	glUseProgram(0);

	GL_ERRORS();
}
