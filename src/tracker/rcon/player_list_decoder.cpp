/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

player_list_decoder.cpp implementation.*/

#include "player_list_decoder.hpp"

#include "../parser/name_decoding.hpp"
#include "../../shared/string_utils.hpp"

#include <array>
#include <charconv>

namespace sandstats::tracker {
namespace {

// Role slots and squad indices the server lists alongside real players.
constexpr std::array<std::string_view, 6> kPlaceholderNames{ "Observer", "Commander", "Marksman", "0", "1", "2" };
constexpr std::array<std::string_view, 2> kPlatformPrefixes{ "SteamNWI:", "EOS:" };

bool IsPlaceholderName(std::string_view name) {
	for (std::string_view placeholder : kPlaceholderNames) {
		if (name == placeholder)
			return true;
	}
	return false;
}

bool HasPlatformPrefix(std::string_view netId) {
	for (std::string_view prefix : kPlatformPrefixes) {
		if (netId.find(prefix) != std::string_view::npos)
			return true;
	}
	return false;
}

int ParseLeadingInt(std::string_view text) {
	text = TrimView(text);
	int value = 0;
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	return ec == std::errc() ? value : 0;
}

} // namespace

/*
=============
DecodePlayerList

The header row (leading cells "ID" and "Name"), separators and placeholder
rows are skipped, as are rows whose net id
carries no recognised platform prefix. An unparsable score reads as 0.
=============
*/
std::vector<LivePlayer> DecodePlayerList(std::string_view response) {
	std::vector<LivePlayer> players;

	for (std::string_view line : SplitView(response, '\n')) {
		line = StripLineEnding(line);
		const std::string_view trimmed = TrimView(line);

		if (trimmed.size() < 10 || trimmed.front() == '=')
			continue;

		const auto parts = SplitView(trimmed, '|');
		if (parts.size() < 5)
			continue;
		if (TrimView(parts[0]) == "ID" && TrimView(parts[1]) == "Name")
			continue;

		LivePlayer player;
		player.name = Trim(parts[1]);
		player.netId = Trim(parts[2]);

		if (player.name.empty() || IsPlaceholderName(player.name))
			continue;
		if (!HasPlatformPrefix(player.netId))
			continue;

		player.platformId = NormalizePlatformId(player.netId);
		if (player.platformId.empty())
			continue;

		player.score = ParseLeadingInt(parts[4]);
		players.push_back(std::move(player));
	}

	return players;
}

} // namespace sandstats::tracker
