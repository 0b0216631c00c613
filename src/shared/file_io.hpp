/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

file_io.hpp declarations.*/

#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <string>

namespace sandstats {

void WriteFileAtomically(const std::filesystem::path& finalPath, const std::function<void(std::ofstream&)>& writer);

// Throws std::system_error when the file cannot be opened or read.
std::string ReadFileContents(const std::filesystem::path& path);

} // namespace sandstats
