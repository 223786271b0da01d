#include <cstddef>

#include "Timer.hpp"

Timer::Timer() {
	Tick();
	Tock();
}

void Timer::Tick() { gettimeofday(&t0, NULL); }
void Timer::Tock() { gettimeofday(&t1, NULL); }

double Timer::Time() const { return (Seconds(t0, t1)); }

double Timer::Elapsed() const {
	struct timeval now;
	gettimeofday(&now, NULL);
	return (Seconds(t0, now));
}

double Timer::Seconds(const struct timeval& t0, const struct timeval& t1) {
	const long secs = t1.tv_sec - t0.tv_sec;
	const long usecs = t1.tv_usec - t0.tv_usec;

	return (secs + (static_cast<double>(usecs) * 1e-6));
}
