#include "SessionStore.hpp"

#include <utility>

using namespace Override;

const std::optional<SSessionRecord>& CMemorySessionStore::get() const {
    return m_record;
}

void CMemorySessionStore::set(SSessionRecord record) {
    m_record = std::move(record);
}

void CMemorySessionStore::clear() {
    m_record.reset();
}
