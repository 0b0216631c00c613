/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

log_time.cpp implementation.*/

#include "log_time.hpp"

#include "string_utils.hpp"

#include <fmt/format.h>

#include <chrono>

namespace sandstats {
namespace {

/*
=============
ReadDigits

Read exactly `count` decimal digits starting at `pos`.
=============
*/
std::optional<int> ReadDigits(std::string_view text, size_t pos, size_t count) {
	if (pos + count > text.size())
		return std::nullopt;

	int value = 0;
	for (size_t i = pos; i < pos + count; ++i) {
		const char c = text[i];
		if (c < '0' || c > '9')
			return std::nullopt;
		value = value * 10 + (c - '0');
	}
	return value;
}

bool Expect(std::string_view text, size_t pos, char c) {
	return pos < text.size() && text[pos] == c;
}

/*
=============
MakeUtcTime

Build a UTC time point from calendar fields, rejecting impossible dates.
=============
*/
std::optional<TimePoint> MakeUtcTime(int year, int month, int day, int hour, int minute, int second, int millis) {
	using namespace std::chrono;

	const year_month_day date{ std::chrono::year{ year }, std::chrono::month{ static_cast<unsigned>(month) }, std::chrono::day{ static_cast<unsigned>(day) } };
	if (!date.ok())
		return std::nullopt;
	if (hour > 23 || minute > 59 || second > 60 || millis > 999)
		return std::nullopt;

	const sys_days dayStart{ date };
	return TimePoint{ dayStart } + hours{ hour } + minutes{ minute } + seconds{ second } + milliseconds{ millis };
}

struct CalendarFields {
	int year = 0;
	unsigned month = 0;
	unsigned day = 0;
	int64_t hour = 0;
	int64_t minute = 0;
	int64_t second = 0;
	int64_t millis = 0;
};

CalendarFields SplitTime(TimePoint time) {
	using namespace std::chrono;

	const auto millis = floor<milliseconds>(time);
	const sys_days dayStart = floor<days>(millis);
	const year_month_day date{ dayStart };
	const milliseconds rest = millis - dayStart;

	CalendarFields fields;
	fields.year = static_cast<int>(date.year());
	fields.month = static_cast<unsigned>(date.month());
	fields.day = static_cast<unsigned>(date.day());
	fields.hour = duration_cast<hours>(rest).count();
	fields.minute = duration_cast<minutes>(rest % hours{ 1 }).count();
	fields.second = duration_cast<seconds>(rest % minutes{ 1 }).count();
	fields.millis = (rest % seconds{ 1 }).count();
	return fields;
}

} // namespace

/*
=============
ParseLineTimestamp

Parse "YYYY.MM.DD-HH.MM.SS:mmm". The millisecond field carries one to three
digits and is read as a plain millisecond count.
=============
*/
std::optional<TimePoint> ParseLineTimestamp(std::string_view text) {
	text = TrimView(text);
	if (text.size() < 21 || text.size() > 23)
		return std::nullopt;

	const auto year = ReadDigits(text, 0, 4);
	const auto month = ReadDigits(text, 5, 2);
	const auto day = ReadDigits(text, 8, 2);
	const auto hour = ReadDigits(text, 11, 2);
	const auto minute = ReadDigits(text, 14, 2);
	const auto second = ReadDigits(text, 17, 2);
	const auto millis = ReadDigits(text, 20, text.size() - 20);

	if (!Expect(text, 4, '.') || !Expect(text, 7, '.') || !Expect(text, 10, '-') ||
		!Expect(text, 13, '.') || !Expect(text, 16, '.') || !Expect(text, 19, ':'))
		return std::nullopt;
	if (!year || !month || !day || !hour || !minute || !second || !millis)
		return std::nullopt;

	return MakeUtcTime(*year, *month, *day, *hour, *minute, *second, *millis);
}

/*
=============
ParseLogOpenTimestamp

Parse "MM/DD/YY HH:MM:SS" as written after "Log file open,".
=============
*/
std::optional<TimePoint> ParseLogOpenTimestamp(std::string_view text) {
	text = TrimView(text);
	if (text.size() != 17)
		return std::nullopt;

	const auto month = ReadDigits(text, 0, 2);
	const auto day = ReadDigits(text, 3, 2);
	const auto year = ReadDigits(text, 6, 2);
	const auto hour = ReadDigits(text, 9, 2);
	const auto minute = ReadDigits(text, 12, 2);
	const auto second = ReadDigits(text, 15, 2);

	if (!Expect(text, 2, '/') || !Expect(text, 5, '/') || !Expect(text, 8, ' ') ||
		!Expect(text, 11, ':') || !Expect(text, 14, ':'))
		return std::nullopt;
	if (!month || !day || !year || !hour || !minute || !second)
		return std::nullopt;

	return MakeUtcTime(2000 + *year, *month, *day, *hour, *minute, *second, 0);
}

std::string FormatLineTimestamp(TimePoint time) {
	const CalendarFields f = SplitTime(time);
	return fmt::format("{:04}.{:02}.{:02}-{:02}.{:02}.{:02}:{:03}", f.year, f.month, f.day, f.hour, f.minute, f.second, f.millis);
}

std::string FormatIsoTimestamp(TimePoint time) {
	const CalendarFields f = SplitTime(time);
	return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", f.year, f.month, f.day, f.hour, f.minute, f.second, f.millis);
}

/*
=============
ParseIsoTimestamp

Inverse of FormatIsoTimestamp.
=============
*/
std::optional<TimePoint> ParseIsoTimestamp(std::string_view text) {
	text = TrimView(text);
	if (text.size() != 24 || text.back() != 'Z')
		return std::nullopt;

	const auto year = ReadDigits(text, 0, 4);
	const auto month = ReadDigits(text, 5, 2);
	const auto day = ReadDigits(text, 8, 2);
	const auto hour = ReadDigits(text, 11, 2);
	const auto minute = ReadDigits(text, 14, 2);
	const auto second = ReadDigits(text, 17, 2);
	const auto millis = ReadDigits(text, 20, 3);

	if (!Expect(text, 4, '-') || !Expect(text, 7, '-') || !Expect(text, 10, 'T') ||
		!Expect(text, 13, ':') || !Expect(text, 16, ':') || !Expect(text, 19, '.'))
		return std::nullopt;
	if (!year || !month || !day || !hour || !minute || !second || !millis)
		return std::nullopt;

	return MakeUtcTime(*year, *month, *day, *hour, *minute, *second, *millis);
}

TimePoint FileTimeToSystem(std::filesystem::file_time_type time) {
	return std::chrono::time_point_cast<Clock::duration>(std::chrono::file_clock::to_sys(time));
}

int64_t ToUnixMillis(TimePoint time) {
	return std::chrono::duration_cast<Milliseconds>(time.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t millis) {
	return TimePoint{ std::chrono::duration_cast<Clock::duration>(Milliseconds{ millis }) };
}

double SecondsBetween(TimePoint from, TimePoint to) {
	return std::chrono::duration<double>(to - from).count();
}

} // namespace sandstats
