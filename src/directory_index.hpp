#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Snapshot of everything under a build folder, keyed by generic relative
// path in reverse lexicographic order so children come before parents.
class DirectoryIndex {
public:
    using Entries = std::map<std::string, std::filesystem::path, std::greater<std::string>>;

    // Creates root if needed, then records every file and directory below it.
    explicit DirectoryIndex(const std::filesystem::path& root);

    // Removes and returns the entry for relative_path, marking it as wanted.
    std::optional<std::filesystem::path> claim(const std::string& relative_path);

    std::size_t size();
    std::vector<std::string> keys();
    // Takes the unclaimed entries, leaving the index empty.
    Entries take_remaining();
private:
    std::mutex m_;
    Entries map_; // relative path -> absolute path
};
