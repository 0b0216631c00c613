/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

events.hpp domain events produced by the line parser.*/

#pragma once

#include "../../shared/log_time.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sandstats::tracker {

// Platform id the game writes for AI-controlled soldiers.
inline constexpr std::string_view kBotPlatformId = "INVALID";

struct PlayerToken {
	std::string name;
	std::string platformId;
	std::optional<int> team;

	bool IsBot() const {
		return platformId.empty() || platformId == kBotPlatformId;
	}
};

struct LogFileOpenEvent {
	TimePoint timestamp{};
};

struct LoginRequestEvent {
	TimePoint timestamp{};
	std::string name;
	std::string platformId;
	std::string platform;
};

struct PlayerRegisterEvent {
	TimePoint timestamp{};
	std::string platformId;
};

struct PlayerJoinEvent {
	TimePoint timestamp{};
	std::string name;
};

enum class LeaveKind {
	Leave,
	Disconnect
};

struct PlayerLeaveEvent {
	TimePoint timestamp{};
	LeaveKind kind = LeaveKind::Disconnect;
	std::string platformId;
};

struct KillEvent {
	TimePoint timestamp{};
	std::vector<PlayerToken> attackers;
	PlayerToken victim;
	std::string rawWeapon;
	std::string weapon;
	std::string weaponType;
};

enum class ObjectiveAction {
	Captured,
	Destroyed
};

struct ObjectiveEvent {
	TimePoint timestamp{};
	ObjectiveAction action = ObjectiveAction::Captured;
	int objective = 0;
	int forTeam = 0;
	// Owning team for destroyed caches, previous holder for captures.
	int fromTeam = 0;
	std::vector<PlayerToken> players;
};

struct RoundStartEvent {
	TimePoint timestamp{};
	int round = 0;
	bool preRound = false;
};

struct RoundEndEvent {
	TimePoint timestamp{};
	std::optional<int> round;
	int winnerTeam = 0;
	std::string reason;
};

enum class MapChangeKind {
	Load,
	Travel
};

struct MapChangeEvent {
	TimePoint timestamp{};
	MapChangeKind kind = MapChangeKind::Load;
	std::string map;
	std::string scenario;
	std::string mode;
	std::string side;
	std::optional<int> maxPlayers;
	std::string lighting;
};

struct GameOverEvent {
	TimePoint timestamp{};
};

enum class ChatCommand {
	Kdr,
	Stats,
	Top,
	Guns
};

struct ChatCommandEvent {
	TimePoint timestamp{};
	std::string name;
	std::string platformId;
	ChatCommand command = ChatCommand::Kdr;
	std::string args;
};

// RCON traffic echoed into the log; only used as a liveness signal.
struct RconActivityEvent {
	TimePoint timestamp{};
	std::string source;
	std::string command;
};

using Event = std::variant<
	LogFileOpenEvent,
	LoginRequestEvent,
	PlayerRegisterEvent,
	PlayerJoinEvent,
	PlayerLeaveEvent,
	KillEvent,
	ObjectiveEvent,
	RoundStartEvent,
	RoundEndEvent,
	MapChangeEvent,
	GameOverEvent,
	ChatCommandEvent,
	RconActivityEvent>;

TimePoint EventTime(const Event& event);
std::string_view EventName(const Event& event);

std::optional<ChatCommand> ParseChatCommand(std::string_view token);
std::string_view ChatCommandName(ChatCommand command);

} // namespace sandstats::tracker
