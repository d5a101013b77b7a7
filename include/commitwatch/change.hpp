#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace commitwatch {

enum class ChangeKind {
    Created,
    Modified,
    Deleted,
};

const char* to_string(ChangeKind k);

struct ChangeEntry {
    std::string path;   // relative to the watched root, '/' separated
    ChangeKind kind{ChangeKind::Modified};

    bool operator==(const ChangeEntry& o) const { return path == o.path && kind == o.kind; }
    bool operator<(const ChangeEntry& o) const { return path < o.path; }
};

// Sorted by path, one entry per path.
using ChangeSet = std::vector<ChangeEntry>;

// Invoked once per settled burst (file triggers) or once per firing (schedule
// triggers, with an empty change set).
using CommitCallback = std::function<void(const std::filesystem::path& repo, const ChangeSet& changes)>;

} // namespace commitwatch
