#include <rex/common/log.h>
#include <rex/decision/audit_trail.hpp>

#include <algorithm>
#include <sstream>

#include <cereal/archives/json.hpp>

namespace rex::decision {
AuditTrail::AuditTrail(std::string path, size_t keepInMemory)
  : m_path(std::move(path))
  , m_keepInMemory(keepInMemory) {
  if(m_path.empty())
    return;

  m_file.open(m_path, std::ios::out | std::ios::app);
  if(!m_file) {
    rex_log(REX_DECISION,
            REX_LOCALERROR,
            "Could not open audit file {}! Keeping decisions in memory only.",
            m_path);
  } else {
    rex_log(REX_DECISION, REX_DEBUG, "Writing decisions to {}.", m_path);
  }
}

AuditTrail::~AuditTrail() {
  if(m_file.is_open())
    m_file.flush();
}

std::string
AuditTrail::toJson(const DecisionRecord& record) {
  std::ostringstream os;
  {
    cereal::JSONOutputArchive ar(os,
                                 cereal::JSONOutputArchive::Options::NoIndent());
    ar(cereal::make_nvp("decision", record));
  }
  std::string s = os.str();
  // NoIndent still leaves line breaks between members.
  for(char& c : s) {
    if(c == '\n')
      c = ' ';
  }
  return s;
}

uint64_t
AuditTrail::append(DecisionRecord record) {
  std::unique_lock lock(m_mutex);
  record.sequence = m_nextSequence++;

  if(m_file.is_open()) {
    try {
      m_file << toJson(record) << '\n';
      m_file.flush();
    } catch(const cereal::Exception& e) {
      rex_log(REX_DECISION,
              REX_LOCALERROR,
              "Could not serialize decision {}: {}",
              record.sequence,
              e.what());
    }
  }

  uint64_t seq = record.sequence;
  m_records.push_back(std::move(record));
  while(m_records.size() > m_keepInMemory)
    m_records.pop_front();
  return seq;
}

uint64_t
AuditTrail::size() const {
  std::unique_lock lock(m_mutex);
  return m_nextSequence - 1;
}

std::vector<DecisionRecord>
AuditTrail::records() const {
  std::unique_lock lock(m_mutex);
  return std::vector<DecisionRecord>(m_records.begin(), m_records.end());
}

std::vector<DecisionRecord>
AuditTrail::history(size_t limit, rex_id missionId) const {
  std::unique_lock lock(m_mutex);
  std::vector<DecisionRecord> recent;
  for(auto it = m_records.rbegin(); it != m_records.rend(); ++it) {
    if(recent.size() >= limit)
      break;
    if(missionId != 0 && it->missionId != missionId)
      continue;
    recent.push_back(*it);
  }
  std::reverse(recent.begin(), recent.end());
  return recent;
}
}
