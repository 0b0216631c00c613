/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

chat_responder.hpp in-game chat stat commands.*/

#pragma once

#include "../events/events.hpp"
#include "../rcon/command_sender.hpp"
#include "../store/stat_store.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace sandstats {
class TaskWorker;
}

namespace sandstats::tracker {

// Players need this much recorded play time to appear in !top.
inline constexpr int64_t kTopMinimumPlaySeconds = 60;
inline constexpr size_t kTopListSize = 3;

/*
=============
ChatResponder

Answers !kdr, !stats, !top and !guns from lifetime totals. The reply text is
built on the calling thread; the "say" command itself is sent from the
remote console worker pool when one is provided.
=============
*/
class ChatResponder {
public:
	ChatResponder(const StatStore& store, CommandSender* sender, TaskWorker* worker = nullptr,
		std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

	void Respond(const std::string& serverId, const ChatCommandEvent& event);

	std::optional<std::string> BuildReply(const ChatCommandEvent& event) const;

private:
	std::string ReplyKdr(const ChatCommandEvent& event, const std::optional<PlayerRecord>& player) const;
	std::string ReplyStats(const ChatCommandEvent& event, const std::optional<PlayerRecord>& player) const;
	std::string ReplyTop() const;
	std::string ReplyGuns(const ChatCommandEvent& event, const std::optional<PlayerRecord>& player) const;

	void Send(const std::string& serverId, const std::string& message);

	const StatStore& store_;
	CommandSender* sender_;
	TaskWorker* worker_;
	std::chrono::milliseconds timeout_;
};

} // namespace sandstats::tracker
