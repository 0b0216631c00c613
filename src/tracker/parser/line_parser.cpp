/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

line_parser.cpp implementation.*/

#include "line_parser.hpp"

#include "name_decoding.hpp"
#include "../../shared/logger.hpp"
#include "../../shared/string_utils.hpp"

#include <algorithm>

namespace sandstats::tracker {
namespace {

constexpr std::string_view kGameplayPrefix = "LogGameplayEvents: Display: ";
constexpr std::string_view kGameModePrefix = "LogGameMode: ";
constexpr std::string_view kLoadMapPrefix = "LogLoad: LoadMap: ";
constexpr std::string_view kNetPrefix = "LogNet: ";
constexpr std::string_view kAntiCheatPrefix = "LogEOSAntiCheat: Display: ";
constexpr std::string_view kChatPrefix = "LogChat: Display: ";
constexpr std::string_view kRconPrefix = "LogRcon: ";
constexpr std::string_view kSessionEnded = "LogSession: Display: AINSGameSession::HandleMatchHasEnded";
constexpr std::string_view kGameOver = "LogGameplayEvents: Display: Game over";

constexpr auto kFlags = std::regex::ECMAScript | std::regex::optimize;

/*
=============
FindQueryParam

Look up a key in an Unreal travel URL ("Map?Scenario=X?MaxPlayers=8").
=============
*/
std::optional<std::string> FindQueryParam(std::string_view query, std::string_view key) {
	size_t pos = 0;
	while (pos <= query.size()) {
		const size_t end = query.find_first_of("?&", pos);
		const std::string_view part = query.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos);
		const size_t eq = part.find('=');
		if (eq != std::string_view::npos && part.substr(0, eq) == key)
			return Trim(part.substr(eq + 1));

		if (end == std::string_view::npos)
			break;
		pos = end + 1;
	}
	return std::nullopt;
}

void LogParseMiss(const ParseContext& context, std::string_view category, std::string_view detail) {
	Logf(LogLevel::Debug, "[{}] dropped {} line: {}", context.serverId, category, detail);
}

// Round end lines come from either the game mode or the gameplay log category.
std::optional<Event> MatchRoundEnd(TimePoint timestamp, const std::string& body, const std::regex& pattern) {
	std::smatch match;
	if (!std::regex_search(body, match, pattern))
		return std::nullopt;

	RoundEndEvent event{ timestamp };
	if (match[1].matched)
		event.round = ParseInt(match.str(1));
	event.winnerTeam = ParseInt(match.str(2)).value_or(0);
	event.reason = Trim(match.str(3));
	return event;
}

} // namespace

LineParser::LineParser()
	: prefix_(R"(^\[(\d{4}\.\d{2}\.\d{2}-\d{2}\.\d{2}\.\d{2}:\d{1,3})\]\[\s*\d+\](.*)$)", kFlags),
	  logFileOpen_(R"(^Log file open,\s*(\d{2}/\d{2}/\d{2} \d{2}:\d{2}:\d{2})\s*$)", kFlags),
	  kill_(R"(^LogGameplayEvents: Display: (.+?) killed ([^\[]+)\[([^,\]]*), team (\d+)\] with (.+)$)", kFlags),
	  objectiveDestroyed_(R"(^LogGameplayEvents: Display: Objective (\d+) owned by team (\d+) was destroyed for team (\d+) by (.+)\.\s*$)", kFlags),
	  objectiveCaptured_(R"(^LogGameplayEvents: Display: Objective (\d+) was captured for team (\d+) from team (\d+) by (.+)\.\s*$)", kFlags),
	  roundStart_(R"(^LogGameplayEvents: Display: (Pre-)?round (\d+) started)", kFlags),
	  roundEnd_(R"(^Log(?:GameMode|GameplayEvents): Display: Round (?:(\d+) )?O\s*ver: Team (\d+) won \(win reason: (.+)\))", kFlags),
	  loginRequest_(R"(^LogNet: Login request:\s*(.*?)\s+userId:\s*(\S+)\s+platform:\s*(\S+)\s*$)", kFlags),
	  joinSucceeded_(R"(^LogNet: Join succeeded: (.+)$)", kFlags),
	  channelClose_(R"(^LogNet: UChannel::Close: .*UniqueId: ([^,\s]+))", kFlags),
	  registerClient_(R"(^LogEOSAntiCheat: Display: ServerRegisterClient: Client: \((\d+)\) Result: \(EOS_Success\))", kFlags),
	  unregisterClient_(R"(^LogEOSAntiCheat: Display: ServerUnregisterClient: UserId \((\d+)\), Result: \(EOS_Success\))", kFlags),
	  mapLoad_(R"(^LogLoad: LoadMap: /Game/Maps/([^/]+)/[^?]+\?(.*)$)", kFlags),
	  mapTravel_(R"(^LogGameMode: ProcessServerTravel: ([^?\s]+)\?(.*)$)", kFlags),
	  chatCommand_(R"(^LogChat: Display: ([^(]+)\((\d+)\) Global Chat: (!\S+)\s*(.*)$)", kFlags),
	  rcon_(R"(^LogRcon: ([^<]+)<< (.+)$)", kFlags),
	  tokenFull_(R"(^(.+?)\[([^,\]]*), team (\d+)\]$)", kFlags),
	  tokenSimple_(R"(^(.+?)\[([^\]]+)\]$)", kFlags) {
}

/*
=============
LineParser::Parse

Entry point. Timestamped lines are dispatched on their log category; the only
untimestamped line of interest is the "Log file open" header.
=============
*/
std::optional<Event> LineParser::Parse(std::string_view line, const ParseContext& context) const {
	line = StripUtf8Bom(StripLineEnding(line));
	if (line.empty())
		return std::nullopt;

	try {
		if (line.front() != '[')
			return ParseUntimestamped(line);

		const std::string text(line);
		std::smatch match;
		if (!std::regex_match(text, match, prefix_))
			return std::nullopt;

		const auto timestamp = ParseLineTimestamp(match.str(1));
		if (!timestamp) {
			LogParseMiss(context, "timestamp", text);
			return std::nullopt;
		}

		return ParseBody(*timestamp, match.str(2), context);
	}
	catch (const std::regex_error& e) {
		Logf(LogLevel::Debug, "[{}] regex failure on line ({}): {}", context.serverId, e.what(), line);
		return std::nullopt;
	}
}

std::optional<Event> LineParser::ParseUntimestamped(std::string_view line) const {
	const std::string text = Trim(line);
	std::smatch match;
	if (!std::regex_match(text, match, logFileOpen_))
		return std::nullopt;

	const auto openedAt = ParseLogOpenTimestamp(match.str(1));
	if (!openedAt)
		return std::nullopt;

	return LogFileOpenEvent{ *openedAt };
}

std::optional<Event> LineParser::ParseBody(TimePoint timestamp, const std::string& body, const ParseContext& context) const {
	const std::string_view view(body);

	if (view.starts_with(kGameplayPrefix))
		return ParseGameplay(timestamp, body, context);
	if (view.starts_with(kNetPrefix))
		return ParseNet(timestamp, body, context);
	if (view.starts_with(kAntiCheatPrefix))
		return ParseAntiCheat(timestamp, body, context);
	if (view.starts_with(kLoadMapPrefix) || view.starts_with("LogGameMode: ProcessServerTravel: "))
		return ParseMapChange(timestamp, body, context);
	if (view.starts_with(kChatPrefix))
		return ParseChat(timestamp, body, context);
	if (view.starts_with(kSessionEnded))
		return GameOverEvent{ timestamp };

	if (view.starts_with(kGameModePrefix))
		return MatchRoundEnd(timestamp, body, roundEnd_);

	if (view.starts_with(kRconPrefix)) {
		std::smatch match;
		if (!std::regex_match(body, match, rcon_))
			return std::nullopt;
		return RconActivityEvent{ timestamp, Trim(match.str(1)), Trim(match.str(2)) };
	}

	return std::nullopt;
}

std::optional<Event> LineParser::ParseGameplay(TimePoint timestamp, const std::string& body, const ParseContext& context) const {
	const std::string_view view(body);
	if (TrimView(view) == kGameOver)
		return GameOverEvent{ timestamp };

	if (view.find(" killed ") != std::string_view::npos)
		return ParseKill(timestamp, body, context);
	if (view.find("Objective ") != std::string_view::npos)
		return ParseObjective(timestamp, body, context);

	std::smatch match;
	if (std::regex_search(body, match, roundStart_)) {
		RoundStartEvent event{ timestamp };
		event.preRound = match[1].matched;
		event.round = ParseInt(match.str(2)).value_or(0);
		return event;
	}

	return MatchRoundEnd(timestamp, body, roundEnd_);
}

/*
=============
LineParser::ParseKill

"<attackers> killed <Victim>[<id>, team <n>] with <weapon>". Attackers are
joined by " + "; a lone "?" means no attacker was recorded.
=============
*/
std::optional<Event> LineParser::ParseKill(TimePoint timestamp, const std::string& body, const ParseContext& context) const {
	std::smatch match;
	if (!std::regex_match(body, match, kill_)) {
		LogParseMiss(context, "kill", body);
		return std::nullopt;
	}

	KillEvent event{ timestamp };
	const std::string attackerText = Trim(match.str(1));
	if (attackerText != "?") {
		event.attackers = ParsePlayerList(attackerText);
		if (event.attackers.empty()) {
			LogParseMiss(context, "kill", body);
			return std::nullopt;
		}
	}

	event.victim.name = Trim(match.str(2));
	event.victim.platformId = NormalizePlatformId(match.str(3));
	event.victim.team = ParseInt(match.str(4));
	event.rawWeapon = Trim(match.str(5));
	event.weapon = CleanWeaponName(event.rawWeapon);
	event.weaponType = WeaponType(event.rawWeapon);

	if (event.weapon.empty()) {
		LogParseMiss(context, "kill", body);
		return std::nullopt;
	}

	return event;
}

std::optional<Event> LineParser::ParseObjective(TimePoint timestamp, const std::string& body, const ParseContext& context) const {
	std::smatch match;
	ObjectiveEvent event{ timestamp };

	if (std::regex_match(body, match, objectiveDestroyed_)) {
		event.action = ObjectiveAction::Destroyed;
		event.objective = ParseInt(match.str(1)).value_or(0);
		event.fromTeam = ParseInt(match.str(2)).value_or(0);
		event.forTeam = ParseInt(match.str(3)).value_or(0);
	}
	else if (std::regex_match(body, match, objectiveCaptured_)) {
		event.action = ObjectiveAction::Captured;
		event.objective = ParseInt(match.str(1)).value_or(0);
		event.forTeam = ParseInt(match.str(2)).value_or(0);
		event.fromTeam = ParseInt(match.str(3)).value_or(0);
	}
	else {
		return std::nullopt;
	}

	event.players = ParsePlayerList(match.str(4));
	if (event.players.empty()) {
		LogParseMiss(context, "objective", body);
		return std::nullopt;
	}

	return event;
}

std::optional<Event> LineParser::ParseNet(TimePoint timestamp, const std::string& body, const ParseContext& context) const {
	std::smatch match;

	if (std::regex_match(body, match, joinSucceeded_)) {
		const std::string name = Trim(match.str(1));
		if (name.empty()) {
			LogParseMiss(context, "join", body);
			return std::nullopt;
		}
		return PlayerJoinEvent{ timestamp, name };
	}

	if (std::string_view(body).starts_with("LogNet: Login request:")) {
		if (!std::regex_match(body, match, loginRequest_)) {
			LogParseMiss(context, "login", body);
			return std::nullopt;
		}

		LoginRequestEvent event{ timestamp };
		event.name = FindQueryParam(match.str(1), "Name").value_or("");
		event.platformId = NormalizePlatformId(match.str(2));
		event.platform = Trim(match.str(3));
		if (event.name.empty() || event.platformId.empty()) {
			LogParseMiss(context, "login", body);
			return std::nullopt;
		}
		return event;
	}

	if (std::regex_search(body, match, channelClose_)) {
		PlayerLeaveEvent event{ timestamp, LeaveKind::Leave };
		event.platformId = NormalizePlatformId(match.str(1));
		if (event.platformId.empty() || event.platformId == kBotPlatformId || event.platformId == "NULL")
			return std::nullopt;
		return event;
	}

	return std::nullopt;
}

std::optional<Event> LineParser::ParseAntiCheat(TimePoint timestamp, const std::string& body, const ParseContext&) const {
	std::smatch match;
	if (std::regex_search(body, match, registerClient_))
		return PlayerRegisterEvent{ timestamp, match.str(1) };

	if (std::regex_search(body, match, unregisterClient_))
		return PlayerLeaveEvent{ timestamp, LeaveKind::Disconnect, match.str(1) };

	return std::nullopt;
}

/*
=============
LineParser::ParseMapChange

LoadMap and ProcessServerTravel both carry the travel URL; the scenario is
required, player cap and lighting are optional.
=============
*/
std::optional<Event> LineParser::ParseMapChange(TimePoint timestamp, const std::string& body, const ParseContext& context) const {
	std::smatch match;
	MapChangeEvent event{ timestamp };

	if (std::regex_match(body, match, mapLoad_))
		event.kind = MapChangeKind::Load;
	else if (std::regex_match(body, match, mapTravel_))
		event.kind = MapChangeKind::Travel;
	else
		return std::nullopt;

	event.map = Trim(match.str(1));
	const std::string query = match.str(2);
	event.scenario = FindQueryParam(query, "Scenario").value_or("");
	if (event.map.empty() || event.scenario.empty()) {
		LogParseMiss(context, "map change", body);
		return std::nullopt;
	}

	if (const auto maxPlayers = FindQueryParam(query, "MaxPlayers"))
		event.maxPlayers = ParseInt(*maxPlayers);
	event.lighting = FindQueryParam(query, "Lighting").value_or("");
	event.mode = ExtractGameMode(event.scenario);
	event.side = ExtractSide(event.scenario);
	return event;
}

std::optional<Event> LineParser::ParseChat(TimePoint timestamp, const std::string& body, const ParseContext&) const {
	std::smatch match;
	if (!std::regex_match(body, match, chatCommand_))
		return std::nullopt;

	const auto command = ParseChatCommand(match.str(3));
	if (!command)
		return std::nullopt;

	ChatCommandEvent event{ timestamp };
	event.name = Trim(match.str(1));
	event.platformId = match.str(2);
	event.command = *command;
	event.args = Trim(match.str(4));
	return event;
}

/*
=============
LineParser::ParsePlayerList

Kill credits are joined by " + ", objective credits by ", " after a closing
bracket. Any part that is neither a token nor "?" rejects the whole list.
=============
*/
std::vector<PlayerToken> LineParser::ParsePlayerList(std::string_view text) const {
	std::vector<PlayerToken> tokens;
	size_t start = 0;
	while (start <= text.size()) {
		const size_t plus = text.find(" + ", start);
		size_t comma = text.find("], ", start);
		if (comma != std::string_view::npos)
			++comma;

		const size_t end = std::min(plus, comma);
		const std::string_view part = text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
		if (auto token = ParsePlayerToken(part))
			tokens.push_back(std::move(*token));
		else if (TrimView(part) != "?")
			return {};

		if (end == std::string_view::npos)
			break;
		start = end + (end == plus ? 3 : 2);
	}
	return tokens;
}

std::optional<PlayerToken> LineParser::ParsePlayerToken(std::string_view text) const {
	const std::string trimmed = Trim(text);
	std::smatch match;

	if (std::regex_match(trimmed, match, tokenFull_)) {
		PlayerToken token;
		token.name = Trim(match.str(1));
		token.platformId = NormalizePlatformId(match.str(2));
		token.team = ParseInt(match.str(3));
		return token;
	}

	if (std::regex_match(trimmed, match, tokenSimple_)) {
		PlayerToken token;
		token.name = Trim(match.str(1));
		token.platformId = NormalizePlatformId(match.str(2));
		return token;
	}

	return std::nullopt;
}

} // namespace sandstats::tracker
