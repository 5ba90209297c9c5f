#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lint {

struct IndexEntry {
    std::string source_path;
    std::optional<std::string> title;
};

// type -> id -> every entry inserted under that key, in insertion order
using IndexSnapshot = std::map<std::string, std::map<std::string, std::vector<IndexEntry>>>;

// Run-scoped directory of known documents, shared by all workers of a batch.
// Every insertion is kept, so duplicate detection can enumerate each occurrence;
// lookup() answers with the most recent one.
// All members lock a single mutex: one writer at a time, and readers never see
// a half-written entry.
class DocumentIndex {
public:
    void insert(const std::string& type, const std::string& id, IndexEntry entry);

    bool contains(const std::string& type, const std::string& id) const;
    std::optional<IndexEntry> lookup(const std::string& type, const std::string& id) const;
    std::vector<IndexEntry> occurrences(const std::string& type, const std::string& id) const;

    IndexSnapshot snapshot() const;
    size_t size() const;  // number of distinct (type, id) keys

private:
    mutable std::mutex m_mutex;
    IndexSnapshot m_entries;
};

}  // namespace lint
