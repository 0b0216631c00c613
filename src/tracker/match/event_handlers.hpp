/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

event_handlers.hpp match and stat state machine.*/

#pragma once

#include "server_session.hpp"
#include "../events/events.hpp"
#include "../score/score_trigger.hpp"
#include "../store/stat_store.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace sandstats::tracker {

class ChatResponder;

struct HandlerConfig {
	// Disconnects this soon after a map travel are connection re-homing.
	std::chrono::milliseconds travelSuppression{ 10000 };
};

struct HandlerContext {
	// Replaying history: original timestamps, no remote console side effects.
	bool catchup = false;
};

/*
=============
EventHandlers

Applies domain events to the store in log order. Match lifecycle is
none -> Ongoing -> {Finished, Crashed}; at most one match per server is
ongoing. Every store write is retried once on its own; a second failure
propagates and the rest of the event is dropped, so writes that already
landed are never repeated.
=============
*/
class EventHandlers {
public:
	EventHandlers(StatStore& store, HandlerConfig config = {}, ScoreTrigger* scoreTrigger = nullptr, ChatResponder* chat = nullptr);

	void Apply(const Event& event, ServerSession& session, const HandlerContext& context);

	// Replays only the session bookkeeping of an event already in the store.
	void RestoreSession(const Event& event, ServerSession& session) const;

	// Latest ongoing match; older duplicates are force-closed as crashed.
	std::optional<MatchRecord> OngoingMatch(const std::string& serverId, TimePoint now);

	void SetScoreTrigger(ScoreTrigger* scoreTrigger) { scoreTrigger_ = scoreTrigger; }
	void SetChatResponder(ChatResponder* chat) { chat_ = chat; }

private:
	void Handle(const LogFileOpenEvent& event, ServerSession& session, const HandlerContext& context);
	void Handle(const LoginRequestEvent& event, ServerSession& session, const HandlerContext& context);
	void Handle(const PlayerRegisterEvent& event, ServerSession& session, const HandlerContext& context);
	void Handle(const PlayerJoinEvent& event, ServerSession& session, const HandlerContext& context);
	void Handle(const PlayerLeaveEvent& event, ServerSession& session, const HandlerContext& context);
	void Handle(const KillEvent& event, ServerSession& session, const HandlerContext& context);
	void Handle(const ObjectiveEvent& event, ServerSession& session, const HandlerContext& context);
	void Handle(const RoundStartEvent& event, ServerSession& session, const HandlerContext& context);
	void Handle(const RoundEndEvent& event, ServerSession& session, const HandlerContext& context);
	void Handle(const MapChangeEvent& event, ServerSession& session, const HandlerContext& context);
	void Handle(const GameOverEvent& event, ServerSession& session, const HandlerContext& context);
	void Handle(const ChatCommandEvent& event, ServerSession& session, const HandlerContext& context);
	void Handle(const RconActivityEvent& event, ServerSession& session, const HandlerContext& context);

	void EndMatch(const MatchRecord& match, MatchStatus status, TimePoint endTime);
	void RecordFriendlyFire(const MatchRecord& match, const PlayerRecord& killer, const PlayerRecord& victim,
		const KillEvent& event, const MatchPlayerStat& killerStat);
	void RequestScoreUpdate(const std::string& serverId, const HandlerContext& context);

	// Store writes with a single retry.
	ServerRecord UpdateServer(const std::string& serverId, const StatStore::Mutator<ServerRecord>& mutate);
	MatchRecord CreateMatch(MatchRecord match);
	MatchRecord UpdateMatch(RecordId matchId, const StatStore::Mutator<MatchRecord>& mutate);
	PlayerRecord UpsertPlayer(const std::string& platformId, const std::string& name);
	MatchPlayerStat UpdatePlayerStat(RecordId matchId, RecordId playerId, const StatStore::Mutator<MatchPlayerStat>& mutate);
	void AddWeaponKill(RecordId matchId, RecordId playerId, const KillEvent& event);
	void AppendFriendlyFire(const FriendlyFireIncident& incident);

	StatStore& store_;
	HandlerConfig config_;
	ScoreTrigger* scoreTrigger_;
	ChatResponder* chat_;
};

} // namespace sandstats::tracker
