/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

server_session.hpp per-server handler state.*/

#pragma once

#include "../../shared/log_time.hpp"

#include <map>
#include <optional>
#include <string>

namespace sandstats::tracker {

/*
=============
ServerSession

Transient login bookkeeping for one server, owned by that server's worker.
Join lines only carry a display name, so the platform id seen in the login
request is remembered here until the join resolves it.
=============
*/
struct ServerSession {
	std::string serverId;

	// platform id -> display name, awaiting anti-cheat registration
	std::map<std::string, std::string> pendingLogins;
	// display name -> platform id, most recent login wins
	std::map<std::string, std::string> platformIdByName;

	std::optional<TimePoint> lastTravelAt;

	void Reset() {
		pendingLogins.clear();
		platformIdByName.clear();
		lastTravelAt.reset();
	}
};

} // namespace sandstats::tracker
