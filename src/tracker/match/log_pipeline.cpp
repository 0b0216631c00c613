/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

log_pipeline.cpp implementation.*/

#include "log_pipeline.hpp"

#include "../../shared/logger.hpp"

namespace sandstats::tracker {

LogPipeline::LogPipeline(const LineParser& parser, EventHandlers& handlers, StatStore& store)
	: parser_(parser), handlers_(handlers), store_(store) {
}

/*
=============
LogPipeline::ProcessLine

Lines at or before the server's applied watermark are skipped, which makes
replaying a range after a crash harmless; they still rebuild the in-memory
session so later joins resolve. The watermark moves even when an
event is dropped so one bad line cannot wedge the queue.
=============
*/
LineOutcome LogPipeline::ProcessLine(ServerSession& session, std::string_view line, const HandlerContext& context,
	const std::optional<LineLocation>& location) {
	const auto event = parser_.Parse(line, ParseContext{ session.serverId });
	if (!event)
		return LineOutcome::Ignored;

	if (location && AlreadyApplied(session.serverId, *location)) {
		Logf(LogLevel::Trace, "[{}] skipping applied {} at {}", session.serverId, EventName(*event), location->endOffset);
		handlers_.RestoreSession(*event, session);
		return LineOutcome::Duplicate;
	}

	const bool applied = Apply(*event, session, context);

	if (location)
		MarkApplied(session.serverId, *location);

	return applied ? LineOutcome::Applied : LineOutcome::Dropped;
}

bool LogPipeline::AlreadyApplied(const std::string& serverId, const LineLocation& location) const {
	const auto server = store_.FindServer(serverId);
	if (!server || !server->appliedGeneration)
		return false;
	return *server->appliedGeneration == location.generation && location.endOffset <= server->appliedOffset;
}

void LogPipeline::MarkApplied(const std::string& serverId, const LineLocation& location) {
	try {
		store_.UpdateServer(serverId, [&](ServerRecord& server) {
			server.appliedGeneration = location.generation;
			server.appliedOffset = location.endOffset;
		});
	}
	catch (const StoreError& e) {
		Logf(LogLevel::Warn, "[{}] could not record applied offset {}: {}", serverId, location.endOffset, e.what());
	}
}

/*
=============
LogPipeline::Apply

The handlers already retried the failing write; whatever part of the event
had not landed by then is dropped.
=============
*/
bool LogPipeline::Apply(const Event& event, ServerSession& session, const HandlerContext& context) {
	try {
		handlers_.Apply(event, session, context);
		return true;
	}
	catch (const StoreError& e) {
		Logf(LogLevel::Warn, "[{}] dropping rest of {} after store error: {}", session.serverId, EventName(event), e.what());
	}
	catch (const std::exception& e) {
		Logf(LogLevel::Error, "[{}] dropping {}: {}", session.serverId, EventName(event), e.what());
	}
	return false;
}

} // namespace sandstats::tracker
