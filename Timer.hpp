#ifndef _TIMER_HDR_
#define _TIMER_HDR_

#include <sys/time.h>

// wall-clock stopwatch
class Timer {
public:
	Timer();

	void Tick();
	void Tock();

	// seconds between Tick() and the last Tock() call
	double Time() const;
	// seconds since Tick(), whether or not Tock() was called
	double Elapsed() const;

private:
	static double Seconds(const struct timeval& t0, const struct timeval& t1);

	struct timeval t0;
	struct timeval t1;
};

#endif
