#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace sl::util {

std::string readFileToString(const std::filesystem::path& path);
void writeFile(const std::filesystem::path& path, const std::string& contents);

// Writes next to `path` as <path>.tmp and renames over it once complete.
void writeFileAtomically(const std::filesystem::path& path, const std::string& contents);

// Replaces every character outside [A-Za-z0-9._-] with '_'.
std::string sanitizeFileName(const std::string& name);

// Lowercased extension without the dot, or nullopt when there is none.
std::optional<std::string> extensionOf(const std::string& name);

// Last path segment of a URL with query and fragment stripped; empty if none.
std::string fileNameFromUrl(const std::string& url);

// Removes a file, logging instead of throwing. Returns true when something was removed.
bool removeQuietly(const std::filesystem::path& path);

bool isOlderThan(const std::filesystem::path& path, std::chrono::seconds age);

}
