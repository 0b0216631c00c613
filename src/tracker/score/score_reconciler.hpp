/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

score_reconciler.hpp declarations.*/

#pragma once

#include "../rcon/command_sender.hpp"
#include "../store/stat_store.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace sandstats::tracker {

struct ReconcileResult {
	bool polled = false;
	size_t updated = 0;
	size_t unknownPlayers = 0;
	std::string error;
};

/*
=============
ScoreReconciler

Pulls the live scoreboard over the remote console and writes score and play
time onto the ongoing match. Only players already known by platform id are
touched; the poll never creates players.
=============
*/
class ScoreReconciler {
public:
	using NowFn = std::function<TimePoint()>;

	ScoreReconciler(StatStore& store, CommandSender* sender, std::chrono::milliseconds timeout, NowFn now = Clock::now);

	// `timeout` overrides the default for servers with their own limit.
	ReconcileResult Reconcile(const std::string& serverId, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

private:
	StatStore& store_;
	CommandSender* sender_;
	std::chrono::milliseconds timeout_;
	NowFn now_;
};

} // namespace sandstats::tracker
