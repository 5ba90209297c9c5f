#include "lint/DocumentIndex.hpp"

namespace lint {

void DocumentIndex::insert(const std::string& type, const std::string& id, IndexEntry entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[type][id].push_back(std::move(entry));
}

bool DocumentIndex::contains(const std::string& type, const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto t = m_entries.find(type);
    if (t == m_entries.end()) return false;
    return t->second.find(id) != t->second.end();
}

std::optional<IndexEntry> DocumentIndex::lookup(const std::string& type, const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto t = m_entries.find(type);
    if (t == m_entries.end()) return std::nullopt;
    auto i = t->second.find(id);
    if (i == t->second.end() || i->second.empty()) return std::nullopt;
    return i->second.back();
}

std::vector<IndexEntry> DocumentIndex::occurrences(const std::string& type, const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto t = m_entries.find(type);
    if (t == m_entries.end()) return {};
    auto i = t->second.find(id);
    if (i == t->second.end()) return {};
    return i->second;
}

IndexSnapshot DocumentIndex::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries;
}

size_t DocumentIndex::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t n = 0;
    for (const auto& [type, ids] : m_entries) n += ids.size();
    return n;
}

}  // namespace lint
