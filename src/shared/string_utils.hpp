/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

string_utils.hpp helpers.*/

#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandstats {

inline bool IsSpace(char c) {
	return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline std::string_view TrimView(std::string_view text) {
	while (!text.empty() && IsSpace(text.front()))
		text.remove_prefix(1);
	while (!text.empty() && IsSpace(text.back()))
		text.remove_suffix(1);
	return text;
}

inline std::string Trim(std::string_view text) {
	return std::string(TrimView(text));
}

/*
=============
StripLineEnding

Remove a trailing newline and an optional carriage return.
=============
*/
inline std::string_view StripLineEnding(std::string_view line) {
	if (!line.empty() && line.back() == '\n')
		line.remove_suffix(1);
	if (!line.empty() && line.back() == '\r')
		line.remove_suffix(1);
	return line;
}

inline std::string_view StripUtf8Bom(std::string_view text) {
	constexpr std::string_view kBom = "\xEF\xBB\xBF";
	if (text.starts_with(kBom))
		text.remove_prefix(kBom.size());
	return text;
}

inline std::string ToLower(std::string_view text) {
	std::string lowered(text);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return lowered;
}

inline std::vector<std::string_view> SplitView(std::string_view text, char separator) {
	std::vector<std::string_view> parts;
	size_t start = 0;
	while (true) {
		const size_t next = text.find(separator, start);
		if (next == std::string_view::npos) {
			parts.push_back(text.substr(start));
			break;
		}
		parts.push_back(text.substr(start, next - start));
		start = next + 1;
	}
	return parts;
}

/*
=============
ParseInt

Parse a whole string as a base-10 integer. Leading and trailing whitespace is
ignored; anything else makes the parse fail.
=============
*/
template <typename T = int>
inline std::optional<T> ParseInt(std::string_view text) {
	text = TrimView(text);
	if (text.empty())
		return std::nullopt;

	T value{};
	const char* first = text.data();
	const char* last = text.data() + text.size();
	if (*first == '+')
		++first;
	const auto [ptr, ec] = std::from_chars(first, last, value);
	if (ec != std::errc() || ptr != last)
		return std::nullopt;
	return value;
}

} // namespace sandstats
