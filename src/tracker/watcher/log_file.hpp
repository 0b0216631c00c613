/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

log_file.hpp low level access to server log files.*/

#pragma once

#include "../../shared/log_time.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace sandstats::tracker {

struct FileState {
	bool exists = false;
	int64_t size = 0;
	TimePoint modified{};
};

FileState StatFile(const std::filesystem::path& path);

// Unix milliseconds of the "Log file open" header, 0 when the file has none.
int64_t ReadLogGeneration(const std::filesystem::path& path);

/*
=============
ReverseLineReader

Walks a file's complete lines from a given end offset back to the start,
reading fixed-size blocks so huge logs are never loaded whole.
=============
*/
class ReverseLineReader {
public:
	ReverseLineReader(const std::filesystem::path& path, int64_t endOffset);

	bool IsOpen() const { return file_.is_open(); }

	// Fills `line` (terminator stripped) and its starting byte offset.
	bool Next(std::string& line, int64_t& startOffset);

private:
	bool FillBlock();

	std::ifstream file_;
	int64_t blockStart_ = 0;
	std::string pending_;
};

} // namespace sandstats::tracker
