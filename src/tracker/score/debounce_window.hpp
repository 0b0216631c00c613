/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

debounce_window.hpp declarations.*/

#pragma once

#include <chrono>
#include <optional>

namespace sandstats::tracker {

using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

/*
=============
DebounceWindow

Trailing-edge debounce with a ceiling. Every trigger pushes the deadline out
to now + window, but never past first trigger + maxWait, so a steady stream
of triggers still fires once per maxWait.
=============
*/
class DebounceWindow {
public:
	DebounceWindow(std::chrono::milliseconds window, std::chrono::milliseconds maxWait);

	void Trigger(SteadyTime now);
	// True once when the deadline has passed; the window is reset.
	bool ConsumeIfDue(SteadyTime now);
	void Reset();

	bool Pending() const { return deadline_.has_value(); }
	std::optional<SteadyTime> Deadline() const { return deadline_; }
	std::optional<SteadyTime> FirstTrigger() const { return firstTrigger_; }

private:
	std::chrono::milliseconds window_;
	std::chrono::milliseconds maxWait_;
	std::optional<SteadyTime> firstTrigger_;
	std::optional<SteadyTime> deadline_;
};

} // namespace sandstats::tracker
