/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

chat_responder.cpp implementation.*/

#include "chat_responder.hpp"

#include "../parser/name_decoding.hpp"
#include "../../shared/logger.hpp"
#include "../../shared/task_worker.hpp"

#include <fmt/format.h>

namespace sandstats::tracker {

ChatResponder::ChatResponder(const StatStore& store, CommandSender* sender, TaskWorker* worker, std::chrono::milliseconds timeout)
	: store_(store), sender_(sender), worker_(worker), timeout_(timeout) {
}

void ChatResponder::Respond(const std::string& serverId, const ChatCommandEvent& event) {
	if (!sender_) {
		Logf(LogLevel::Debug, "[{}] no remote console, ignoring !{}", serverId, ChatCommandName(event.command));
		return;
	}

	const auto reply = BuildReply(event);
	if (!reply)
		return;

	Logf(LogLevel::Info, "[{}] {} used !{}", serverId, event.name, ChatCommandName(event.command));
	Send(serverId, *reply);
}

std::optional<std::string> ChatResponder::BuildReply(const ChatCommandEvent& event) const {
	std::optional<PlayerRecord> player;
	if (!event.platformId.empty())
		player = store_.FindPlayerByPlatformId(NormalizePlatformId(event.platformId));

	switch (event.command) {
	case ChatCommand::Kdr:
		return ReplyKdr(event, player);
	case ChatCommand::Stats:
		return ReplyStats(event, player);
	case ChatCommand::Top:
		return ReplyTop();
	case ChatCommand::Guns:
		return ReplyGuns(event, player);
	}
	return std::nullopt;
}

std::string ChatResponder::ReplyKdr(const ChatCommandEvent& event, const std::optional<PlayerRecord>& player) const {
	int kills = 0;
	int deaths = 0;
	if (player) {
		if (const auto totals = store_.GetPlayerTotals(player->id)) {
			kills = totals->kills;
			deaths = totals->deaths;
		}
	}

	const double kdr = deaths > 0 ? static_cast<double>(kills) / deaths : static_cast<double>(kills);
	return fmt::format("{}: {} kills, {} deaths, K/D: {:.2f}", event.name, kills, deaths, kdr);
}

/*
=============
ChatResponder::ReplyStats

Rank is one plus the number of players with a strictly better score per
minute, out of every player with recorded play time.
=============
*/
std::string ChatResponder::ReplyStats(const ChatCommandEvent& event, const std::optional<PlayerRecord>& player) const {
	const auto totals = player ? store_.GetPlayerTotals(player->id) : std::nullopt;
	if (!totals || totals->playSeconds <= 0)
		return fmt::format("{}: No stats available yet!", event.name);

	const auto ranked = store_.RankPlayersByScorePerMinute();
	const double rate = totals->ScorePerMinute();
	size_t rank = 1;
	for (const PlayerTotals& other : ranked) {
		if (other.playerId != totals->playerId && other.ScorePerMinute() > rate)
			++rank;
	}

	const int64_t hours = totals->playSeconds / 3600;
	const int64_t minutes = (totals->playSeconds % 3600) / 60;
	const std::string& name = player->name.empty() ? event.name : player->name;
	return fmt::format("{}: Score: {}, Time: {}h{}m, Score/Min: {:.1f}, Rank: #{}/{}",
		name, totals->score, hours, minutes, rate, rank, ranked.size());
}

std::string ChatResponder::ReplyTop() const {
	std::string message = "Top 3 Players by Score/Min:";
	size_t listed = 0;
	for (const PlayerTotals& totals : store_.RankPlayersByScorePerMinute()) {
		if (totals.playSeconds < kTopMinimumPlaySeconds)
			continue;
		++listed;
		message += fmt::format(" | #{}: {} - {:.1f} score/min", listed, totals.name, totals.ScorePerMinute());
		if (listed == kTopListSize)
			break;
	}

	if (!listed)
		return "No stats available yet!";
	return message;
}

std::string ChatResponder::ReplyGuns(const ChatCommandEvent& event, const std::optional<PlayerRecord>& player) const {
	const auto weapons = player ? store_.TopWeapons(player->id, kTopListSize) : std::vector<WeaponTotals>{};
	if (weapons.empty())
		return fmt::format("{}: No weapon stats available yet!", event.name);

	std::string list;
	for (size_t i = 0; i < weapons.size(); ++i) {
		if (i)
			list += ", ";
		list += fmt::format("#{}: {} ({})", i + 1, weapons[i].weapon, weapons[i].kills);
	}
	return fmt::format("{}'s Top Weapons: {}", event.name, list);
}

void ChatResponder::Send(const std::string& serverId, const std::string& message) {
	auto send = [sender = sender_, timeout = timeout_, serverId, command = "say " + message]() {
		const CommandResult result = sender->SendCommand(serverId, command, timeout);
		if (!result.success)
			Logf(LogLevel::Warn, "[{}] chat reply failed: {}", serverId, result.error);
	};

	if (!worker_) {
		send();
		return;
	}
	if (!worker_->Enqueue(fmt::format("chat reply {}", serverId), std::move(send)))
		Logf(LogLevel::Warn, "[{}] remote console worker stopping, chat reply dropped", serverId);
}

} // namespace sandstats::tracker
