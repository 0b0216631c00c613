/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

log_pipeline.hpp declarations.*/

#pragma once

#include "event_handlers.hpp"
#include "server_session.hpp"
#include "../parser/line_parser.hpp"
#include "../store/stat_store.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace sandstats::tracker {

// Where a line sits in its log file; used to skip already applied lines.
struct LineLocation {
	int64_t generation = 0;
	// Byte offset just past the line terminator.
	int64_t endOffset = 0;
};

enum class LineOutcome {
	Ignored,
	Duplicate,
	Applied,
	Dropped
};

/*
=============
LogPipeline

Parse, dedupe and apply one line. Shared by every server worker; all per
server state travels in the ServerSession argument.
=============
*/
class LogPipeline {
public:
	LogPipeline(const LineParser& parser, EventHandlers& handlers, StatStore& store);

	LineOutcome ProcessLine(ServerSession& session, std::string_view line, const HandlerContext& context,
		const std::optional<LineLocation>& location = std::nullopt);

private:
	bool AlreadyApplied(const std::string& serverId, const LineLocation& location) const;
	void MarkApplied(const std::string& serverId, const LineLocation& location);
	bool Apply(const Event& event, ServerSession& session, const HandlerContext& context);

	const LineParser& parser_;
	EventHandlers& handlers_;
	StatStore& store_;
};

} // namespace sandstats::tracker
