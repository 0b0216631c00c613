/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

score_trigger.hpp interface handlers use to request score reconciliation.*/

#pragma once

#include <string>

namespace sandstats::tracker {

class ScoreTrigger {
public:
	virtual ~ScoreTrigger() = default;

	// Debounced request after a score-affecting event.
	virtual void Trigger(const std::string& serverId) = 0;
	// Bypass the window, e.g. at round end.
	virtual void ExecuteImmediately(const std::string& serverId) = 0;
	// Drop any pending request, e.g. once the match is over.
	virtual void Cancel(const std::string& serverId) = 0;
};

} // namespace sandstats::tracker
