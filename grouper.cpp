#include "grouper.hpp"
#include <utility>

void CEventGrouper::push(const SRawEvent& event) {
    m_batch.push_back(event);
}

EventBatch CEventGrouper::flush() {
    EventBatch out = std::move(m_batch);
    m_batch.clear();
    return out;
}

bool CEventGrouper::empty() const {
    return m_batch.empty();
}

size_t CEventGrouper::size() const {
    return m_batch.size();
}
