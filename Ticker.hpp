#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

//"Ticker" turns variable frame times into a count of fixed-length ticks.
// Leftover time carries over to the next call, so ticks never drift.
struct Ticker {
	Ticker(float period_) : period(period_) {
		if (!(period > 0.0f)) throw std::runtime_error("Tick period must be positive.");
	}

	//add 'elapsed' seconds; returns how many full periods have now passed (at most MaxTicks):
	uint32_t advance(float elapsed) {
		accumulated += elapsed;
		if (accumulated < period) return 0;

		float periods = std::floor(accumulated / period);
		if (periods >= float(MaxTicks)) {
			//too far behind to catch up; drop the backlog:
			accumulated = 0.0f;
			return MaxTicks;
		}
		uint32_t ticks = uint32_t(periods);
		accumulated = std::max(0.0f, accumulated - float(ticks) * period);
		return ticks;
	}

	float period; //seconds per tick
	float accumulated = 0.0f; //seconds since the last tick

	static constexpr const uint32_t MaxTicks = 100;
};
