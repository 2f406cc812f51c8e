#include "Settings.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

namespace {
	Settings parse(std::string const &text) {
		std::istringstream in(text);
		return Settings::parse(in, "test.cfg");
	}

	//parse 'text' and return the error message it throws (or "" if it doesn't):
	std::string parse_error(std::string const &text) {
		try {
			parse(text);
		} catch (std::runtime_error const &e) {
			return e.what();
		}
		return "";
	}
}

TEST(Settings, DefaultsMatchClassicLayout) {
	Settings settings = parse("");
	EXPECT_FLOAT_EQ(settings.tick_period, 0.05f);
	EXPECT_EQ(settings.window_title, "Pong x64");
	EXPECT_EQ(settings.window_size, glm::uvec2(712, 512));
	EXPECT_EQ(settings.controls.down[Game::Left], "S");
	EXPECT_EQ(settings.controls.up[Game::Left], "Z");
	EXPECT_EQ(settings.controls.down[Game::Right], "Down");
	EXPECT_EQ(settings.controls.up[Game::Right], "Up");
}

TEST(Settings, ReadsAllKeys) {
	Settings settings = parse(
		"# faster game, wider window\n"
		"tick_ms 20\n"
		"\n"
		"window_title   My Pong   \n"
		"window_size 1024 600 # with margins\n"
		"p1_down D\n"
		"p1_up Left Shift\n"
		"p2_down Keypad 2\n"
		"p2_up Keypad 8\n"
	);
	EXPECT_FLOAT_EQ(settings.tick_period, 0.02f);
	EXPECT_EQ(settings.window_title, "My Pong");
	EXPECT_EQ(settings.window_size, glm::uvec2(1024, 600));
	EXPECT_EQ(settings.controls.down[Game::Left], "D");
	EXPECT_EQ(settings.controls.up[Game::Left], "Left Shift");
	EXPECT_EQ(settings.controls.down[Game::Right], "Keypad 2");
	EXPECT_EQ(settings.controls.up[Game::Right], "Keypad 8");
}

TEST(Settings, SwappedBindingsAreAllowed) {
	Settings settings = parse(
		"p1_down Down\n"
		"p1_up Up\n"
		"p2_down S\n"
		"p2_up Z\n"
	);
	EXPECT_EQ(settings.controls.down[Game::Left], "Down");
	EXPECT_EQ(settings.controls.up[Game::Right], "Z");
}

TEST(Settings, LowerCaseLetterBindingsDriveThePaddle) {
	Settings settings = parse("p1_down s\np1_up z\n");
	struct NullView : GameView {
		virtual void ball_moved(glm::vec2 const &, glm::vec2 const &) override { }
		virtual void paddle_moved(Game::Side, float) override { }
		virtual void score_changed(Game::Side, std::string const &) override { }
	} view;
	Game game;
	EXPECT_TRUE(game.handle_key("S", settings.controls, view));
	EXPECT_EQ(game.paddle_top[Game::Left], 165.0f);
	EXPECT_TRUE(game.handle_key("Z", settings.controls, view));
	EXPECT_EQ(game.paddle_top[Game::Left], 140.0f);
}

TEST(Settings, UnknownKeysWarn) {
	testing::internal::CaptureStderr();
	Settings settings = parse("volume 11\ntick_ms 100\n");
	std::string err = testing::internal::GetCapturedStderr();
	EXPECT_NE(err.find("WARNING"), std::string::npos);
	EXPECT_NE(err.find("test.cfg:1"), std::string::npos);
	EXPECT_NE(err.find("volume"), std::string::npos);
	EXPECT_FLOAT_EQ(settings.tick_period, 0.1f);
}

TEST(Settings, BadValuesNameTheLine) {
	EXPECT_NE(parse_error("tick_ms 50\ntick_ms fast\n").find("test.cfg:2"), std::string::npos);
	EXPECT_NE(parse_error("tick_ms 50ms\n"), "");
	EXPECT_NE(parse_error("tick_ms 0\n"), "");
	EXPECT_NE(parse_error("tick_ms -5\n"), "");
	EXPECT_NE(parse_error("window_size 800\n"), "");
	EXPECT_NE(parse_error("window_size 800 0\n"), "");
	EXPECT_NE(parse_error("window_size 800 600 2\n"), "");
	EXPECT_NE(parse_error("\n\nwindow_title\n").find("test.cfg:3"), std::string::npos);
	EXPECT_NE(parse_error("p1_up   # nothing\n"), "");
}

TEST(Settings, KeysCanOnlyHaveOneAction) {
	//collides with the default p2_down:
	std::string error = parse_error("tick_ms 50\np1_down Down\n");
	EXPECT_NE(error.find("test.cfg:2"), std::string::npos);
	EXPECT_NE(error.find("'Down'"), std::string::npos);

	EXPECT_NE(parse_error("p2_up Q\np2_down Q\n"), "");

	//same key, different case (collides with the default p1_up 'Z'):
	EXPECT_NE(parse_error("p1_down z\n").find("test.cfg:1"), std::string::npos);
	EXPECT_NE(parse_error("p2_up down\n"), "");
}

TEST(Settings, TickMustBeAtLeastOneMillisecond) {
	EXPECT_NE(parse_error("tick_ms 0.0000001\n").find("test.cfg:1"), std::string::npos);
	EXPECT_NE(parse_error("tick_ms 0.5\n"), "");
	EXPECT_FLOAT_EQ(parse("tick_ms 1\n").tick_period, 0.001f);
}

TEST(Settings, MissingFileThrows) {
	EXPECT_THROW(Settings::load("/nonexistent/pong/settings.cfg"), std::runtime_error);
}
