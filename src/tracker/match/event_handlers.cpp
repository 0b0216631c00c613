/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

event_handlers.cpp implementation.*/

#include "event_handlers.hpp"

#include "chat_responder.hpp"
#include "../parser/name_decoding.hpp"
#include "../../shared/logger.hpp"

#include <algorithm>
#include <variant>

namespace sandstats::tracker {

namespace {

int64_t SessionSeconds(const std::optional<TimePoint>& startedAt, TimePoint endedAt) {
	if (!startedAt || endedAt <= *startedAt)
		return 0;
	return std::chrono::duration_cast<Seconds>(endedAt - *startedAt).count();
}

// First sighting of a player in a match opens their first session.
void MarkPresent(MatchPlayerStat& stat, const std::optional<int>& team, TimePoint at) {
	if (!stat.firstJoinedAt) {
		stat.connected = true;
		stat.sessionCount = 1;
		stat.firstJoinedAt = at;
		stat.sessionStartedAt = at;
		stat.status = PlayerMatchStatus::Ongoing;
	}
	if (team)
		stat.team = team;
}

void CloseSession(MatchPlayerStat& stat, TimePoint at, PlayerMatchStatus status) {
	if (stat.connected) {
		stat.closedPlayTime += SessionSeconds(stat.sessionStartedAt, at);
		stat.totalPlayTime = std::max(stat.totalPlayTime, stat.closedPlayTime);
		stat.sessionStartedAt.reset();
		stat.lastLeftAt = at;
	}
	stat.connected = false;
	stat.status = status;
}

bool SameTeam(const PlayerToken& a, const PlayerToken& b) {
	return a.team && b.team && *a.team == *b.team;
}

/*
=============
Retry

Runs one store write, and once more if it raised StoreError. A failed
mutation leaves its row untouched, so the second attempt cannot double
count.
=============
*/
template <typename Write>
auto Retry(const char* what, Write&& write) -> decltype(write()) {
	try {
		return write();
	}
	catch (const StoreError& e) {
		Logf(LogLevel::Debug, "store error on {}, retrying: {}", what, e.what());
	}
	return write();
}

} // namespace

EventHandlers::EventHandlers(StatStore& store, HandlerConfig config, ScoreTrigger* scoreTrigger, ChatResponder* chat)
	: store_(store), config_(config), scoreTrigger_(scoreTrigger), chat_(chat) {
}

void EventHandlers::Apply(const Event& event, ServerSession& session, const HandlerContext& context) {
	std::visit([&](const auto& typed) { Handle(typed, session, context); }, event);
}

void EventHandlers::RestoreSession(const Event& event, ServerSession& session) const {
	if (const auto* login = std::get_if<LoginRequestEvent>(&event)) {
		session.pendingLogins[login->platformId] = login->name;
		session.platformIdByName[login->name] = login->platformId;
	}
	else if (const auto* map = std::get_if<MapChangeEvent>(&event)) {
		if (map->kind == MapChangeKind::Travel)
			session.lastTravelAt = map->timestamp;
	}
	else if (std::holds_alternative<LogFileOpenEvent>(event)) {
		session.Reset();
	}
}

/*
=============
EventHandlers::OngoingMatch

Enforces the one-ongoing-match invariant on read: every ongoing match but
the newest is closed as crashed before the newest is returned.
=============
*/
std::optional<MatchRecord> EventHandlers::OngoingMatch(const std::string& serverId, TimePoint now) {
	auto ongoing = store_.FindOngoingMatches(serverId);
	if (ongoing.empty())
		return std::nullopt;

	if (ongoing.size() > 1) {
		Logf(LogLevel::Error, "[{}] {} ongoing matches, closing all but #{}", serverId, ongoing.size(), ongoing.back().id);
		for (size_t i = 0; i + 1 < ongoing.size(); ++i)
			EndMatch(ongoing[i], MatchStatus::Crashed, now);
	}
	return ongoing.back();
}

void EventHandlers::EndMatch(const MatchRecord& match, MatchStatus status, TimePoint endTime) {
	UpdateMatch(match.id, [&](MatchRecord& record) {
		record.status = status;
		record.endTime = endTime;
	});

	const PlayerMatchStatus rowStatus = status == MatchStatus::Finished ? PlayerMatchStatus::Finished : PlayerMatchStatus::Disconnected;
	for (const MatchPlayerStat& stat : store_.ListPlayerStats(match.id)) {
		if (!stat.connected)
			continue;
		UpdatePlayerStat(match.id, stat.playerId, [&](MatchPlayerStat& row) {
			CloseSession(row, endTime, rowStatus);
		});
	}

	Logf(LogLevel::Info, "[{}] match #{} on {} ended ({}, {} rounds)", match.serverId, match.id, match.map, MatchStatusName(status), match.round);
}

ServerRecord EventHandlers::UpdateServer(const std::string& serverId, const StatStore::Mutator<ServerRecord>& mutate) {
	return Retry("server update", [&] { return store_.UpdateServer(serverId, mutate); });
}

MatchRecord EventHandlers::CreateMatch(MatchRecord match) {
	return Retry("match create", [&] { return store_.CreateMatch(match); });
}

MatchRecord EventHandlers::UpdateMatch(RecordId matchId, const StatStore::Mutator<MatchRecord>& mutate) {
	return Retry("match update", [&] { return store_.UpdateMatch(matchId, mutate); });
}

PlayerRecord EventHandlers::UpsertPlayer(const std::string& platformId, const std::string& name) {
	return Retry("player upsert", [&] { return store_.UpsertPlayer(platformId, name); });
}

MatchPlayerStat EventHandlers::UpdatePlayerStat(RecordId matchId, RecordId playerId, const StatStore::Mutator<MatchPlayerStat>& mutate) {
	return Retry("player stat update", [&] { return store_.UpdatePlayerStat(matchId, playerId, mutate); });
}

void EventHandlers::AddWeaponKill(RecordId matchId, RecordId playerId, const KillEvent& event) {
	Retry("weapon stat update", [&] { store_.AddWeaponKills(matchId, playerId, event.weapon, event.weaponType, 1); });
}

void EventHandlers::AppendFriendlyFire(const FriendlyFireIncident& incident) {
	Retry("friendly fire append", [&] { store_.AppendFriendlyFire(incident); });
}

void EventHandlers::RequestScoreUpdate(const std::string& serverId, const HandlerContext& context) {
	if (!context.catchup && scoreTrigger_)
		scoreTrigger_->Trigger(serverId);
}

/*
=============
EventHandlers::Handle(LogFileOpenEvent)

A fresh log while a match is still ongoing means the previous process died
without writing its game over.
=============
*/
void EventHandlers::Handle(const LogFileOpenEvent& event, ServerSession& session, const HandlerContext&) {
	UpdateServer(session.serverId, [&](ServerRecord& server) {
		server.logOpenedAt = event.timestamp;
	});
	session.Reset();

	for (const MatchRecord& match : store_.FindOngoingMatches(session.serverId)) {
		Logf(LogLevel::Warn, "[{}] log reopened with match #{} ongoing, marking crashed", session.serverId, match.id);
		EndMatch(match, MatchStatus::Crashed, event.timestamp);
	}
}

void EventHandlers::Handle(const LoginRequestEvent& event, ServerSession& session, const HandlerContext&) {
	session.pendingLogins[event.platformId] = event.name;
	session.platformIdByName[event.name] = event.platformId;
	Logf(LogLevel::Debug, "[{}] login request {} ({} {})", session.serverId, event.name, event.platform, event.platformId);
}

void EventHandlers::Handle(const PlayerRegisterEvent& event, ServerSession& session, const HandlerContext&) {
	const auto pending = session.pendingLogins.find(event.platformId);
	if (pending == session.pendingLogins.end()) {
		Logf(LogLevel::Debug, "[{}] register for {} without a login request", session.serverId, event.platformId);
		return;
	}

	const PlayerRecord player = UpsertPlayer(event.platformId, pending->second);
	session.pendingLogins.erase(pending);
	Logf(LogLevel::Debug, "[{}] authenticated {} as player #{}", session.serverId, player.name, player.id);
}

/*
=============
EventHandlers::Handle(PlayerJoinEvent)

Opens a new session on the player's row in the ongoing match. A join for a
player who is already connected is a no-op.
=============
*/
void EventHandlers::Handle(const PlayerJoinEvent& event, ServerSession& session, const HandlerContext&) {
	const auto known = session.platformIdByName.find(event.name);
	if (known == session.platformIdByName.end()) {
		Logf(LogLevel::Debug, "[{}] join for {} without a login request", session.serverId, event.name);
		return;
	}

	const PlayerRecord player = UpsertPlayer(known->second, event.name);
	session.pendingLogins.erase(known->second);

	const auto match = OngoingMatch(session.serverId, event.timestamp);
	if (!match) {
		Logf(LogLevel::Debug, "[{}] {} joined with no ongoing match", session.serverId, event.name);
		return;
	}

	UpdatePlayerStat(match->id, player.id, [&](MatchPlayerStat& stat) {
		if (stat.connected)
			return;
		stat.connected = true;
		stat.sessionCount += 1;
		if (!stat.firstJoinedAt)
			stat.firstJoinedAt = event.timestamp;
		stat.sessionStartedAt = event.timestamp;
		stat.status = PlayerMatchStatus::Ongoing;
	});
}

void EventHandlers::Handle(const PlayerLeaveEvent& event, ServerSession& session, const HandlerContext&) {
	if (session.lastTravelAt && event.timestamp >= *session.lastTravelAt &&
		event.timestamp - *session.lastTravelAt < config_.travelSuppression) {
		Logf(LogLevel::Debug, "[{}] ignoring disconnect of {} right after map travel", session.serverId, event.platformId);
		return;
	}

	const auto player = store_.FindPlayerByPlatformId(event.platformId);
	if (!player)
		return;

	const auto match = OngoingMatch(session.serverId, event.timestamp);
	if (!match)
		return;

	const auto stat = store_.FindPlayerStat(match->id, player->id);
	if (!stat || !stat->connected)
		return;

	UpdatePlayerStat(match->id, player->id, [&](MatchPlayerStat& row) {
		CloseSession(row, event.timestamp, PlayerMatchStatus::Disconnected);
	});
	Logf(LogLevel::Debug, "[{}] {} left match #{}", session.serverId, player->name, match->id);
}

/*
=============
EventHandlers::Handle(KillEvent)

The first attacker owns the kill: an opposing victim is a kill with weapon
credit, themselves is a suicide and a player teammate is friendly fire.
Every further attacker gets one assist plus weapon credit whatever the first
attacker did. Bots are never credited, but a player killed by a bot or by
the world still takes the death.
=============
*/
void EventHandlers::Handle(const KillEvent& event, ServerSession& session, const HandlerContext& context) {
	const auto match = OngoingMatch(session.serverId, event.timestamp);
	if (!match) {
		Logf(LogLevel::Debug, "[{}] kill with no ongoing match", session.serverId);
		return;
	}

	const PlayerToken& victim = event.victim;
	const bool victimIsPlayer = !victim.IsBot();
	std::optional<PlayerRecord> victimPlayer;
	if (victimIsPlayer)
		victimPlayer = UpsertPlayer(victim.platformId, victim.name);

	if (!event.attackers.empty() && !event.attackers.front().IsBot()) {
		const PlayerToken& primary = event.attackers.front();
		const PlayerRecord killer = UpsertPlayer(primary.platformId, primary.name);
		const bool suicide = victimIsPlayer && primary.platformId == victim.platformId;

		// A suicide only costs the victim a death, recorded below.
		if (suicide) {
			Logf(LogLevel::Trace, "[{}] {} killed themselves", session.serverId, primary.name);
		}
		else if (SameTeam(primary, victim)) {
			if (victimIsPlayer) {
				const MatchPlayerStat killerStat = UpdatePlayerStat(match->id, killer.id, [&](MatchPlayerStat& stat) {
					MarkPresent(stat, primary.team, event.timestamp);
					stat.friendlyFireKills += 1;
				});
				RecordFriendlyFire(*match, killer, *victimPlayer, event, killerStat);
			}
			else {
				Logf(LogLevel::Trace, "[{}] {} killed a friendly bot", session.serverId, primary.name);
			}
		}
		else {
			UpdatePlayerStat(match->id, killer.id, [&](MatchPlayerStat& stat) {
				MarkPresent(stat, primary.team, event.timestamp);
				stat.kills += 1;
			});
			AddWeaponKill(match->id, killer.id, event);
		}
	}

	if (victimPlayer) {
		UpdatePlayerStat(match->id, victimPlayer->id, [&](MatchPlayerStat& stat) {
			MarkPresent(stat, victim.team, event.timestamp);
			stat.deaths += 1;
		});
	}

	for (size_t i = 1; i < event.attackers.size(); ++i) {
		const PlayerToken& assist = event.attackers[i];
		if (assist.IsBot())
			continue;

		const PlayerRecord assister = UpsertPlayer(assist.platformId, assist.name);
		UpdatePlayerStat(match->id, assister.id, [&](MatchPlayerStat& stat) {
			MarkPresent(stat, assist.team, event.timestamp);
			stat.assists += 1;
		});
		AddWeaponKill(match->id, assister.id, event);
	}

	RequestScoreUpdate(session.serverId, context);
}

void EventHandlers::RecordFriendlyFire(const MatchRecord& match, const PlayerRecord& killer, const PlayerRecord& victim,
	const KillEvent& event, const MatchPlayerStat& killerStat) {
	FriendlyFireIncident incident;
	incident.matchId = match.id;
	incident.killerId = killer.id;
	incident.victimId = victim.id;
	incident.weapon = event.weapon;
	incident.timestamp = event.timestamp;
	incident.killerTeam = event.attackers.front().team;
	incident.victimTeam = event.victim.team;
	incident.secondsSinceMatchStart = SessionSeconds(match.startTime, event.timestamp);
	incident.killerKillsInMatch = killerStat.kills;
	incident.killerFriendlyFireInMatch = killerStat.friendlyFireKills;
	incident.explosiveWeapon = IsExplosiveWeapon(event.rawWeapon);
	incident.vehicleWeapon = IsVehicleWeapon(event.rawWeapon);
	incident.map = match.map;
	incident.mode = match.mode;

	std::optional<TimePoint> previous;
	for (const FriendlyFireIncident& earlier : store_.ListFriendlyFire(match.id)) {
		if (earlier.killerId == killer.id && earlier.timestamp <= event.timestamp && (!previous || earlier.timestamp > *previous))
			previous = earlier.timestamp;
	}
	if (previous)
		incident.secondsSinceLastFriendlyFire = SessionSeconds(previous, event.timestamp);

	AppendFriendlyFire(incident);
	Logf(LogLevel::Info, "[{}] friendly fire: {} killed {} with {}", match.serverId, killer.name, victim.name, event.weapon);
}

void EventHandlers::Handle(const ObjectiveEvent& event, ServerSession& session, const HandlerContext& context) {
	const auto match = OngoingMatch(session.serverId, event.timestamp);
	if (!match) {
		Logf(LogLevel::Debug, "[{}] objective {} with no ongoing match", session.serverId, event.objective);
		return;
	}

	const bool captured = event.action == ObjectiveAction::Captured;
	for (const PlayerToken& token : event.players) {
		if (token.IsBot())
			continue;

		const PlayerRecord player = UpsertPlayer(token.platformId, token.name);
		const std::optional<int> team = token.team ? token.team : std::optional<int>(event.forTeam);
		UpdatePlayerStat(match->id, player.id, [&](MatchPlayerStat& stat) {
			MarkPresent(stat, team, event.timestamp);
			if (captured)
				stat.objectivesCaptured += 1;
			else
				stat.objectivesDestroyed += 1;
		});
	}

	UpdateMatch(match->id, [](MatchRecord& record) {
		record.roundObjective += 1;
	});

	RequestScoreUpdate(session.serverId, context);
}

void EventHandlers::Handle(const RoundStartEvent& event, ServerSession& session, const HandlerContext&) {
	if (event.preRound)
		return;

	const auto match = OngoingMatch(session.serverId, event.timestamp);
	if (!match)
		return;

	UpdateMatch(match->id, [](MatchRecord& record) {
		record.roundObjective = 0;
	});
}

void EventHandlers::Handle(const RoundEndEvent& event, ServerSession& session, const HandlerContext& context) {
	const auto match = OngoingMatch(session.serverId, event.timestamp);
	if (!match) {
		Logf(LogLevel::Debug, "[{}] round end with no ongoing match", session.serverId);
		return;
	}

	const MatchRecord updated = UpdateMatch(match->id, [&](MatchRecord& record) {
		record.round += 1;
		record.winnerTeam = event.winnerTeam;
	});
	Logf(LogLevel::Debug, "[{}] match #{} round {} won by team {} ({})", session.serverId, updated.id, updated.round, event.winnerTeam, event.reason);

	if (!context.catchup && scoreTrigger_)
		scoreTrigger_->ExecuteImmediately(session.serverId);
}

/*
=============
EventHandlers::Handle(MapChangeEvent)

Ends whatever is ongoing and starts the next match at round zero. The same
map at the same start time is a replayed line and changes nothing.
=============
*/
void EventHandlers::Handle(const MapChangeEvent& event, ServerSession& session, const HandlerContext&) {
	if (event.kind == MapChangeKind::Travel)
		session.lastTravelAt = event.timestamp;

	const auto current = OngoingMatch(session.serverId, event.timestamp);
	if (current) {
		if (current->map == event.map && current->startTime == event.timestamp) {
			Logf(LogLevel::Debug, "[{}] map change to {} already applied", session.serverId, event.map);
			return;
		}
		// The LoadMap that completes a travel belongs to the travel's match.
		if (event.kind == MapChangeKind::Load && current->map == event.map &&
			session.lastTravelAt && current->startTime == *session.lastTravelAt) {
			UpdateMatch(current->id, [&](MatchRecord& record) {
				if (event.maxPlayers)
					record.maxPlayers = event.maxPlayers;
			});
			return;
		}
		EndMatch(*current, MatchStatus::Finished, event.timestamp);
	}

	MatchRecord match;
	match.serverId = session.serverId;
	match.map = event.map;
	match.scenario = event.scenario;
	match.mode = event.mode;
	match.playerTeam = event.side;
	match.maxPlayers = event.maxPlayers;
	match.startTime = event.timestamp;
	match.status = MatchStatus::Ongoing;

	const MatchRecord created = CreateMatch(std::move(match));
	Logf(LogLevel::Info, "[{}] match #{} started on {} ({})", session.serverId, created.id, created.map, created.mode);
}

void EventHandlers::Handle(const GameOverEvent& event, ServerSession& session, const HandlerContext& context) {
	const auto match = OngoingMatch(session.serverId, event.timestamp);
	if (!match)
		return;

	EndMatch(*match, MatchStatus::Finished, event.timestamp);

	if (!context.catchup && scoreTrigger_)
		scoreTrigger_->Cancel(session.serverId);
}

void EventHandlers::Handle(const ChatCommandEvent& event, ServerSession& session, const HandlerContext& context) {
	if (context.catchup || !chat_) {
		Logf(LogLevel::Trace, "[{}] not answering !{} from {}", session.serverId, ChatCommandName(event.command), event.name);
		return;
	}
	chat_->Respond(session.serverId, event);
}

void EventHandlers::Handle(const RconActivityEvent&, ServerSession&, const HandlerContext&) {
}

} // namespace sandstats::tracker
