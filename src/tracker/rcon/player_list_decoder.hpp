/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

player_list_decoder.hpp declarations.*/

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sandstats::tracker {

inline constexpr const char* kListPlayersCommand = "listplayers";

struct LivePlayer {
	std::string name;
	std::string netId;
	std::string platformId;
	int score = 0;
};

// Decode a "listplayers" table: "ID | Name | NetID | IP | Score | ...".
std::vector<LivePlayer> DecodePlayerList(std::string_view response);

} // namespace sandstats::tracker
