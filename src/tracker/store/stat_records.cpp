/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

stat_records.cpp implementation.*/

#include "stat_records.hpp"

namespace sandstats::tracker {

std::string_view MatchStatusName(MatchStatus status) {
	switch (status) {
	case MatchStatus::Ongoing:
		return "ongoing";
	case MatchStatus::Finished:
		return "finished";
	case MatchStatus::Crashed:
	default:
		return "crashed";
	}
}

std::optional<MatchStatus> ParseMatchStatus(std::string_view text) {
	if (text == "ongoing")
		return MatchStatus::Ongoing;
	if (text == "finished")
		return MatchStatus::Finished;
	if (text == "crashed")
		return MatchStatus::Crashed;
	return std::nullopt;
}

std::string_view PlayerMatchStatusName(PlayerMatchStatus status) {
	switch (status) {
	case PlayerMatchStatus::Ongoing:
		return "ongoing";
	case PlayerMatchStatus::Disconnected:
		return "disconnected";
	case PlayerMatchStatus::Finished:
	default:
		return "finished";
	}
}

std::optional<PlayerMatchStatus> ParsePlayerMatchStatus(std::string_view text) {
	if (text == "ongoing")
		return PlayerMatchStatus::Ongoing;
	if (text == "disconnected")
		return PlayerMatchStatus::Disconnected;
	if (text == "finished")
		return PlayerMatchStatus::Finished;
	return std::nullopt;
}

} // namespace sandstats::tracker
