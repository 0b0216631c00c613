/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

catchup_engine.hpp declarations.*/

#pragma once

#include "server_worker.hpp"
#include "../parser/line_parser.hpp"
#include "../rcon/command_sender.hpp"
#include "../store/stat_store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace sandstats::tracker {

struct CatchupConfig {
	std::chrono::milliseconds liveThreshold{ std::chrono::minutes(1) };
	std::chrono::milliseconds idleThreshold{ std::chrono::hours(6) };
	std::chrono::milliseconds livenessWindow{ std::chrono::seconds(30) };
	size_t livenessTailLines = 100;
	std::chrono::milliseconds markerMaxAge{ std::chrono::minutes(30) };
	std::chrono::milliseconds queryTimeout{ std::chrono::seconds(5) };
};

struct CatchupPlan {
	bool replay = false;
	std::string reason;
	int64_t generation = 0;
	// Replay covers [startOffset, endOffset); endOffset is the size captured up front.
	int64_t startOffset = 0;
	int64_t endOffset = 0;
	std::optional<MapChangeEvent> marker;
};

enum class StartMode {
	Resumed,
	Restarted,
	CaughtUp,
	Skipped
};

struct StartResult {
	StartMode mode = StartMode::Skipped;
	CatchupPlan plan;
	ReadStats replayed;
};

/*
=============
CatchupEngine

Decides where a server's worker starts reading. A saved cursor is resumed
as is; otherwise a recent map change is replayed in catch-up mode when the
log looks live, and everything older is skipped.
=============
*/
class CatchupEngine {
public:
	using NowFn = std::function<TimePoint()>;

	CatchupEngine(const LineParser& parser, StatStore& store, CatchupConfig config = {}, ServerQuerier* querier = nullptr, NowFn now = Clock::now);

	CatchupPlan Plan(const std::filesystem::path& logPath, const std::string& queryAddress = {}) const;

	StartResult Prepare(ServerWorker& worker, const std::string& queryAddress = {}) const;

private:
	bool HasRecentLivenessMarker(const std::filesystem::path& logPath, int64_t endOffset, TimePoint now) const;
	std::optional<std::pair<int64_t, MapChangeEvent>> FindMapMarker(const std::filesystem::path& logPath, int64_t endOffset, TimePoint now) const;
	bool ConfirmWithQuery(const std::string& queryAddress, const MapChangeEvent& marker, std::string& reason) const;

	const LineParser& parser_;
	StatStore& store_;
	CatchupConfig config_;
	ServerQuerier* querier_;
	NowFn now_;
};

const char* StartModeName(StartMode mode);

} // namespace sandstats::tracker
