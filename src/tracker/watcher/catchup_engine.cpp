/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

catchup_engine.cpp implementation.*/

#include "catchup_engine.hpp"

#include "log_file.hpp"
#include "../../shared/logger.hpp"
#include "../../shared/string_utils.hpp"

#include <fmt/format.h>

#include <variant>

namespace sandstats::tracker {

const char* StartModeName(StartMode mode) {
	switch (mode) {
	case StartMode::Resumed:
		return "resumed";
	case StartMode::Restarted:
		return "restarted";
	case StartMode::CaughtUp:
		return "caught up";
	case StartMode::Skipped:
	default:
		return "skipped";
	}
}

CatchupEngine::CatchupEngine(const LineParser& parser, StatStore& store, CatchupConfig config, ServerQuerier* querier, NowFn now)
	: parser_(parser), store_(store), config_(config), querier_(querier), now_(std::move(now)) {
}

/*
=============
CatchupEngine::Prepare

Positions the worker's cursor and, on a first run, replays the in-progress
match. Must run before the worker thread starts.
=============
*/
StartResult CatchupEngine::Prepare(ServerWorker& worker, const std::string& queryAddress) const {
	StartResult result;
	const std::string& serverId = worker.ServerId();
	const int64_t generation = ReadLogGeneration(worker.LogPath());

	const auto server = store_.FindServer(serverId);
	if (server && server->cursorGeneration) {
		if (*server->cursorGeneration == generation) {
			worker.SetCursor(ReadCursor{ generation, server->cursorOffset });
			result.mode = StartMode::Resumed;
		}
		else {
			worker.SetCursor(ReadCursor{ generation, 0 });
			result.mode = StartMode::Restarted;
		}
		Logf(LogLevel::Info, "[{}] {} at offset {}", serverId, StartModeName(result.mode), worker.Cursor().offset);
		return result;
	}

	result.plan = Plan(worker.LogPath(), queryAddress);
	if (!result.plan.replay) {
		worker.SetCursor(ReadCursor{ result.plan.generation, result.plan.endOffset });
		result.mode = StartMode::Skipped;
		Logf(LogLevel::Info, "[{}] catch-up skipped ({}), starting at offset {}", serverId, result.plan.reason, result.plan.endOffset);
		return result;
	}

	worker.SetCursor(ReadCursor{ result.plan.generation, result.plan.startOffset });
	HandlerContext context;
	context.catchup = true;
	result.replayed = worker.ReadRange(result.plan.endOffset, context);
	result.mode = StartMode::CaughtUp;
	Logf(LogLevel::Info, "[{}] caught up {} lines ({} applied) from {} on {}", serverId, result.replayed.lines,
		result.replayed.applied, result.plan.startOffset, result.plan.marker ? result.plan.marker->map : std::string("?"));
	return result;
}

/*
=============
CatchupEngine::Plan

A log is considered live when its mtime is within the threshold; the
threshold is short when a remote console echo near the tail proves someone
is polling the server right now, and long otherwise.
=============
*/
CatchupPlan CatchupEngine::Plan(const std::filesystem::path& logPath, const std::string& queryAddress) const {
	CatchupPlan plan;

	const FileState state = StatFile(logPath);
	if (!state.exists) {
		plan.reason = "log file missing";
		return plan;
	}
	plan.generation = ReadLogGeneration(logPath);
	plan.endOffset = state.size;

	const TimePoint now = now_();
	const bool live = HasRecentLivenessMarker(logPath, state.size, now);
	const auto threshold = live ? config_.liveThreshold : config_.idleThreshold;
	if (now - state.modified > threshold) {
		plan.reason = fmt::format("log idle for {:.0f}s", SecondsBetween(state.modified, now));
		return plan;
	}

	const auto marker = FindMapMarker(logPath, state.size, now);
	if (!marker) {
		plan.reason = "no recent map change";
		return plan;
	}

	if (!ConfirmWithQuery(queryAddress, marker->second, plan.reason))
		return plan;

	plan.replay = true;
	plan.startOffset = marker->first;
	plan.marker = marker->second;
	plan.reason = fmt::format("{} on {} {:.0f}s ago", marker->second.kind == MapChangeKind::Travel ? "travel" : "load",
		marker->second.map, SecondsBetween(marker->second.timestamp, now));
	return plan;
}

bool CatchupEngine::HasRecentLivenessMarker(const std::filesystem::path& logPath, int64_t endOffset, TimePoint now) const {
	ReverseLineReader reader(logPath, endOffset);
	std::string line;
	int64_t start = 0;
	for (size_t scanned = 0; scanned < config_.livenessTailLines && reader.Next(line, start); ++scanned) {
		const auto event = parser_.Parse(line, ParseContext{});
		if (!event || !std::holds_alternative<RconActivityEvent>(*event))
			continue;

		const TimePoint at = EventTime(*event);
		const auto distance = at > now ? at - now : now - at;
		if (distance <= config_.livenessWindow)
			return true;
	}
	return false;
}

/*
=============
CatchupEngine::FindMapMarker

Walks back from the end to the newest map change inside the recency window.
A LoadMap that directly follows a ProcessServerTravel is the tail end of that
travel, so the travel is the anchor; a LoadMap right after the log header is
a boot-time load and anchors on its own.
=============
*/
std::optional<std::pair<int64_t, MapChangeEvent>> CatchupEngine::FindMapMarker(const std::filesystem::path& logPath, int64_t endOffset, TimePoint now) const {
	const TimePoint cutoff = now - config_.markerMaxAge;
	std::optional<std::pair<int64_t, MapChangeEvent>> latest;

	ReverseLineReader reader(logPath, endOffset);
	std::string line;
	int64_t start = 0;
	while (reader.Next(line, start)) {
		const auto event = parser_.Parse(line, ParseContext{});
		if (!event)
			continue;

		if (std::holds_alternative<LogFileOpenEvent>(*event))
			break;
		if (EventTime(*event) < cutoff)
			break;

		const auto* map = std::get_if<MapChangeEvent>(&*event);
		if (!map)
			continue;

		if (latest) {
			if (map->kind == MapChangeKind::Travel)
				return std::make_pair(start, *map);
			break;
		}

		latest = std::make_pair(start, *map);
		if (map->kind == MapChangeKind::Travel)
			break;
	}
	return latest;
}

bool CatchupEngine::ConfirmWithQuery(const std::string& queryAddress, const MapChangeEvent& marker, std::string& reason) const {
	if (!querier_ || queryAddress.empty())
		return true;

	const QueryInfoResult info = querier_->QueryInfo(queryAddress, config_.queryTimeout);
	if (!info.success) {
		reason = fmt::format("server query failed: {}", info.error);
		return false;
	}
	if (!info.map.empty() && ToLower(info.map).find(ToLower(marker.map)) == std::string::npos) {
		reason = fmt::format("server reports map {}, log says {}", info.map, marker.map);
		return false;
	}
	return true;
}

} // namespace sandstats::tracker
