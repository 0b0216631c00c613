/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_log_time.cpp implementation.*/

#include "shared/log_time.hpp"

#include <cassert>
#include <chrono>

using namespace sandstats;

/*
=============
main

Line and header timestamps parse as UTC; malformed text is rejected.
=============
*/
int main()
{
	const auto line = ParseLineTimestamp("2025.10.04-21.27.51:780");
	assert(line.has_value());
	assert(FormatIsoTimestamp(*line) == "2025-10-04T21:27:51.780Z");
	assert(FormatLineTimestamp(*line) == "2025.10.04-21.27.51:780");

	// Short millisecond fields are a plain count, not a fraction.
	const auto shortMillis = ParseLineTimestamp("2025.10.04-21.27.51:7");
	assert(shortMillis.has_value());
	assert(ToUnixMillis(*shortMillis) - ToUnixMillis(*line) == 7 - 780);

	assert(!ParseLineTimestamp("2025.13.04-21.27.51:780"));
	assert(!ParseLineTimestamp("2025.02.30-21.27.51:780"));
	assert(!ParseLineTimestamp("2025-10-04 21:27:51"));
	assert(!ParseLineTimestamp(""));

	const auto opened = ParseLogOpenTimestamp("11/10/25 20:58:31");
	assert(opened.has_value());
	assert(FormatIsoTimestamp(*opened) == "2025-11-10T20:58:31.000Z");
	assert(!ParseLogOpenTimestamp("11/10/2025 20:58:31"));

	const auto iso = ParseIsoTimestamp("2025-10-04T21:27:51.780Z");
	assert(iso.has_value() && *iso == *line);
	assert(FromUnixMillis(ToUnixMillis(*line)) == *line);
	assert(!ParseIsoTimestamp("2025-10-04T21:27:51Z"));

	return 0;
}
