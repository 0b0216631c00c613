/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

log_file.cpp implementation.*/

#include "log_file.hpp"

#include "../../shared/string_utils.hpp"

#include <algorithm>
#include <system_error>

namespace sandstats::tracker {

namespace {

constexpr int64_t kReverseBlockSize = 64 * 1024;
constexpr std::string_view kLogOpenPrefix = "Log file open,";

} // namespace

FileState StatFile(const std::filesystem::path& path) {
	FileState state;
	std::error_code ec;
	const auto size = std::filesystem::file_size(path, ec);
	if (ec)
		return state;

	const auto modified = std::filesystem::last_write_time(path, ec);
	if (ec)
		return state;

	state.exists = true;
	state.size = static_cast<int64_t>(size);
	state.modified = FileTimeToSystem(modified);
	return state;
}

/*
=============
ReadLogGeneration

The game writes the open timestamp as the first line of every new log, so it
identifies a log generation even when the new file has already outgrown the
old read offset.
=============
*/
int64_t ReadLogGeneration(const std::filesystem::path& path) {
	std::ifstream file(path, std::ios::binary);
	if (!file.is_open())
		return 0;

	std::string first;
	if (!std::getline(file, first))
		return 0;

	std::string_view header = StripUtf8Bom(StripLineEnding(first));
	header = TrimView(header);
	if (!header.starts_with(kLogOpenPrefix))
		return 0;

	const auto opened = ParseLogOpenTimestamp(TrimView(header.substr(kLogOpenPrefix.size())));
	return opened ? ToUnixMillis(*opened) : 0;
}

ReverseLineReader::ReverseLineReader(const std::filesystem::path& path, int64_t endOffset)
	: file_(path, std::ios::binary), blockStart_(std::max<int64_t>(endOffset, 0)) {
}

bool ReverseLineReader::FillBlock() {
	if (blockStart_ <= 0)
		return false;

	const int64_t readSize = std::min(kReverseBlockSize, blockStart_);
	blockStart_ -= readSize;

	std::string block(static_cast<size_t>(readSize), '\0');
	file_.clear();
	file_.seekg(blockStart_);
	if (!file_.read(block.data(), readSize))
		return false;

	pending_.insert(0, block);
	return true;
}

bool ReverseLineReader::Next(std::string& line, int64_t& startOffset) {
	if (!file_.is_open())
		return false;

	while (true) {
		const size_t contentEnd = !pending_.empty() && pending_.back() == '\n' ? pending_.size() - 1 : pending_.size();
		const size_t split = contentEnd == 0 ? std::string::npos : pending_.rfind('\n', contentEnd - 1);

		if (split != std::string::npos) {
			line.assign(pending_, split + 1, contentEnd - split - 1);
			startOffset = blockStart_ + static_cast<int64_t>(split) + 1;
			pending_.resize(split + 1);
		}
		else if (blockStart_ > 0) {
			if (!FillBlock())
				return false;
			continue;
		}
		else if (!pending_.empty()) {
			line.assign(pending_, 0, contentEnd);
			startOffset = 0;
			pending_.clear();
		}
		else {
			return false;
		}

		if (!line.empty() && line.back() == '\r')
			line.pop_back();
		return true;
	}
}

} // namespace sandstats::tracker
