/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

line_parser.hpp declarations.*/

#pragma once

#include "../events/events.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace sandstats::tracker {

struct ParseContext {
	std::string serverId;
};

/*
=============
LineParser

Turns one raw server log line into at most one domain event. Parsing never
throws: unknown lines and lines missing a required field yield no event.
Instances hold compiled patterns and are safe to share between threads.
=============
*/
class LineParser {
public:
	LineParser();

	std::optional<Event> Parse(std::string_view line, const ParseContext& context) const;

	// Split an attacker or objective credit list ("A[1, team 0] + B[2, team 0]").
	std::vector<PlayerToken> ParsePlayerList(std::string_view text) const;
	std::optional<PlayerToken> ParsePlayerToken(std::string_view text) const;

private:
	std::optional<Event> ParseUntimestamped(std::string_view line) const;
	std::optional<Event> ParseBody(TimePoint timestamp, const std::string& body, const ParseContext& context) const;

	std::optional<Event> ParseGameplay(TimePoint timestamp, const std::string& body, const ParseContext& context) const;
	std::optional<Event> ParseKill(TimePoint timestamp, const std::string& body, const ParseContext& context) const;
	std::optional<Event> ParseObjective(TimePoint timestamp, const std::string& body, const ParseContext& context) const;
	std::optional<Event> ParseNet(TimePoint timestamp, const std::string& body, const ParseContext& context) const;
	std::optional<Event> ParseAntiCheat(TimePoint timestamp, const std::string& body, const ParseContext& context) const;
	std::optional<Event> ParseMapChange(TimePoint timestamp, const std::string& body, const ParseContext& context) const;
	std::optional<Event> ParseChat(TimePoint timestamp, const std::string& body, const ParseContext& context) const;

	std::regex prefix_;
	std::regex logFileOpen_;
	std::regex kill_;
	std::regex objectiveDestroyed_;
	std::regex objectiveCaptured_;
	std::regex roundStart_;
	std::regex roundEnd_;
	std::regex loginRequest_;
	std::regex joinSucceeded_;
	std::regex channelClose_;
	std::regex registerClient_;
	std::regex unregisterClient_;
	std::regex mapLoad_;
	std::regex mapTravel_;
	std::regex chatCommand_;
	std::regex rcon_;
	std::regex tokenFull_;
	std::regex tokenSimple_;
};

} // namespace sandstats::tracker
