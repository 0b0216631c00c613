/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

debounce_window.cpp implementation.*/

#include "debounce_window.hpp"

#include <algorithm>

namespace sandstats::tracker {

DebounceWindow::DebounceWindow(std::chrono::milliseconds window, std::chrono::milliseconds maxWait)
	: window_(window), maxWait_(std::max(window, maxWait)) {
}

void DebounceWindow::Trigger(SteadyTime now) {
	if (!firstTrigger_)
		firstTrigger_ = now;

	deadline_ = std::min(now + window_, *firstTrigger_ + maxWait_);
}

bool DebounceWindow::ConsumeIfDue(SteadyTime now) {
	if (!deadline_ || now < *deadline_)
		return false;

	Reset();
	return true;
}

void DebounceWindow::Reset() {
	firstTrigger_.reset();
	deadline_.reset();
}

} // namespace sandstats::tracker
