/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

events.cpp implementation.*/

#include "events.hpp"

#include "../../shared/string_utils.hpp"

#include <type_traits>

namespace sandstats::tracker {

TimePoint EventTime(const Event& event) {
	return std::visit([](const auto& e) { return e.timestamp; }, event);
}

/*
=============
EventName

Short stable name for log output.
=============
*/
std::string_view EventName(const Event& event) {
	return std::visit([](const auto& e) -> std::string_view {
		using T = std::decay_t<decltype(e)>;
		if constexpr (std::is_same_v<T, LogFileOpenEvent>)
			return "log_file_open";
		else if constexpr (std::is_same_v<T, LoginRequestEvent>)
			return "login_request";
		else if constexpr (std::is_same_v<T, PlayerRegisterEvent>)
			return "player_register";
		else if constexpr (std::is_same_v<T, PlayerJoinEvent>)
			return "player_join";
		else if constexpr (std::is_same_v<T, PlayerLeaveEvent>)
			return e.kind == LeaveKind::Leave ? "player_leave" : "player_disconnect";
		else if constexpr (std::is_same_v<T, KillEvent>)
			return "kill";
		else if constexpr (std::is_same_v<T, ObjectiveEvent>)
			return e.action == ObjectiveAction::Captured ? "objective_captured" : "objective_destroyed";
		else if constexpr (std::is_same_v<T, RoundStartEvent>)
			return "round_start";
		else if constexpr (std::is_same_v<T, RoundEndEvent>)
			return "round_end";
		else if constexpr (std::is_same_v<T, MapChangeEvent>)
			return e.kind == MapChangeKind::Load ? "map_load" : "map_travel";
		else if constexpr (std::is_same_v<T, GameOverEvent>)
			return "game_over";
		else if constexpr (std::is_same_v<T, ChatCommandEvent>)
			return "chat_command";
		else
			return "rcon_activity";
	}, event);
}

std::optional<ChatCommand> ParseChatCommand(std::string_view token) {
	const std::string lowered = ToLower(TrimView(token));
	if (lowered == "!kdr")
		return ChatCommand::Kdr;
	if (lowered == "!stats")
		return ChatCommand::Stats;
	if (lowered == "!top")
		return ChatCommand::Top;
	if (lowered == "!guns" || lowered == "!weapons")
		return ChatCommand::Guns;
	return std::nullopt;
}

std::string_view ChatCommandName(ChatCommand command) {
	switch (command) {
	case ChatCommand::Kdr:
		return "kdr";
	case ChatCommand::Stats:
		return "stats";
	case ChatCommand::Top:
		return "top";
	case ChatCommand::Guns:
	default:
		return "guns";
	}
}

} // namespace sandstats::tracker
