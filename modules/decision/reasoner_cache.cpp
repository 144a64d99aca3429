#include "reasoner_cache.hpp"

namespace rex::decision {
// Separators inside names or values must not merge two fields into one.
static void
AppendEscaped(std::string& k, const std::string& s) {
  for(char c : s) {
    if(c == '|' || c == '=' || c == '\\')
      k += '\\';
    k += c;
  }
}

ReasonerCache::ReasonerCache(Duration ttl, size_t maxEntries)
  : m_ttl(ttl)
  , m_maxEntries(maxEntries) {}

std::string
ReasonerCache::key(RequestType type, const ContextFields& fields) {
  std::string k = RequestTypeToStr(type);
  for(auto& [name, value] : fields) {
    // Free text differs between otherwise identical failures.
    if(name == "message")
      continue;
    k += '|';
    AppendEscaped(k, name);
    k += '=';
    AppendEscaped(k, value);
  }
  return k;
}

std::optional<ReasonerCache::Answer>
ReasonerCache::get(const std::string& key, TimePoint now) {
  std::unique_lock lock(m_mutex);
  auto it = m_index.find(key);
  if(it == m_index.end())
    return std::nullopt;

  auto entry = it->second;
  if(now - entry->storedAt >= m_ttl) {
    m_entries.erase(entry);
    m_index.erase(it);
    return std::nullopt;
  }
  m_entries.splice(m_entries.begin(), m_entries, entry);
  return entry->answer;
}

void
ReasonerCache::put(const std::string& key, Answer answer, TimePoint now) {
  if(m_maxEntries == 0)
    return;

  std::unique_lock lock(m_mutex);
  auto it = m_index.find(key);
  if(it != m_index.end()) {
    it->second->answer = answer;
    it->second->storedAt = now;
    m_entries.splice(m_entries.begin(), m_entries, it->second);
    return;
  }

  m_entries.push_front(Entry{ key, answer, now });
  m_index[key] = m_entries.begin();

  while(m_entries.size() > m_maxEntries) {
    m_index.erase(m_entries.back().key);
    m_entries.pop_back();
  }
}

size_t
ReasonerCache::size() const {
  std::unique_lock lock(m_mutex);
  return m_entries.size();
}
}
