/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

command_sender.hpp remote console and server query collaborators.*/

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace sandstats::tracker {

struct CommandResult {
	bool success = false;
	std::string response;
	std::string error;
};

/*
=============
CommandSender

Sends one remote console command to a server. Implementations must return
within `timeout`; failures are reported in the result, never thrown.
=============
*/
class CommandSender {
public:
	virtual ~CommandSender() = default;
	virtual CommandResult SendCommand(const std::string& serverId, const std::string& command, std::chrono::milliseconds timeout) = 0;
};

struct QueryInfoResult {
	bool success = false;
	int players = 0;
	std::string map;
	std::string error;
};

// Optional server-info query used as a liveness signal during catch-up.
class ServerQuerier {
public:
	virtual ~ServerQuerier() = default;
	virtual QueryInfoResult QueryInfo(const std::string& address, std::chrono::milliseconds timeout) = 0;
};

} // namespace sandstats::tracker
