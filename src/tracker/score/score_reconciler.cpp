/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

score_reconciler.cpp implementation.*/

#include "score_reconciler.hpp"

#include "../rcon/player_list_decoder.hpp"
#include "../../shared/logger.hpp"

#include <algorithm>

namespace sandstats::tracker {

ScoreReconciler::ScoreReconciler(StatStore& store, CommandSender* sender, std::chrono::milliseconds timeout, NowFn now)
	: store_(store), sender_(sender), timeout_(timeout), now_(std::move(now)) {
}

/*
=============
ScoreReconciler::Reconcile

A failed poll leaves every row untouched. Score is taken as reported; play
time is the closed sessions plus the open one up to now.
=============
*/
ReconcileResult ScoreReconciler::Reconcile(const std::string& serverId, std::optional<std::chrono::milliseconds> timeout) {
	ReconcileResult result;

	if (!sender_) {
		result.error = "no remote console configured";
		return result;
	}

	const auto ongoing = store_.FindOngoingMatches(serverId);
	if (ongoing.empty()) {
		result.error = "no ongoing match";
		Logf(LogLevel::Debug, "[{}] score reconcile skipped: no ongoing match", serverId);
		return result;
	}
	const MatchRecord& match = ongoing.back();

	const CommandResult reply = sender_->SendCommand(serverId, kListPlayersCommand, timeout.value_or(timeout_));
	if (!reply.success) {
		result.error = reply.error.empty() ? "listplayers failed" : reply.error;
		Logf(LogLevel::Warn, "[{}] score reconcile skipped: {}", serverId, result.error);
		return result;
	}
	result.polled = true;

	const TimePoint now = now_();
	for (const LivePlayer& live : DecodePlayerList(reply.response)) {
		const auto player = store_.FindPlayerByPlatformId(live.platformId);
		if (!player) {
			++result.unknownPlayers;
			Logf(LogLevel::Trace, "[{}] score reconcile: {} ({}) not yet known", serverId, live.name, live.platformId);
			continue;
		}

		store_.UpdatePlayerStat(match.id, player->id, [&](MatchPlayerStat& stat) {
			stat.score = live.score;
			int64_t openSession = 0;
			if (stat.connected && stat.sessionStartedAt && now > *stat.sessionStartedAt)
				openSession = std::chrono::duration_cast<Seconds>(now - *stat.sessionStartedAt).count();
			stat.totalPlayTime = std::max(stat.totalPlayTime, stat.closedPlayTime + openSession);
		});
		++result.updated;
	}

	Logf(LogLevel::Debug, "[{}] score reconcile updated {} player(s), {} unknown", serverId, result.updated, result.unknownPlayers);
	return result;
}

} // namespace sandstats::tracker
