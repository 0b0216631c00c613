/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

file_io.cpp implementation.*/

#include "file_io.hpp"

#include <cerrno>
#include <sstream>
#include <system_error>

namespace sandstats {

/*
=============
WriteFileAtomically

Writes file contents to a temporary sibling (<path>.tmp) before renaming the
result into place. Streams are opened in binary mode with exceptions enabled
so callers can detect failures; the temporary file is removed on error.
=============
*/
void WriteFileAtomically(const std::filesystem::path& finalPath, const std::function<void(std::ofstream&)>& writer) {
	const std::filesystem::path tempPath(finalPath.string() + ".tmp");

	std::ofstream file;
	file.exceptions(std::ios::failbit | std::ios::badbit);
	try {
		if (finalPath.has_parent_path())
			std::filesystem::create_directories(finalPath.parent_path());

		file.open(tempPath, std::ios::binary | std::ios::trunc);
		writer(file);
		file.flush();
		file.close();

		std::filesystem::rename(tempPath, finalPath);
	}
	catch (...) {
		if (file.is_open()) {
			file.exceptions(std::ios::goodbit);
			file.close();
		}

		std::error_code cleanupError;
		std::filesystem::remove(tempPath, cleanupError);
		throw;
	}
}

/*
=============
ReadFileContents
=============
*/
std::string ReadFileContents(const std::filesystem::path& path) {
	std::ifstream file(path, std::ios::binary);
	if (!file)
		throw std::system_error(errno ? errno : ENOENT, std::generic_category(), "Failed to open " + path.string());

	std::ostringstream buffer;
	buffer << file.rdbuf();
	if (file.bad())
		throw std::system_error(EIO, std::generic_category(), "Failed to read " + path.string());

	return buffer.str();
}

} // namespace sandstats
