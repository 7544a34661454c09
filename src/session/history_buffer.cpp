#include "session/history_buffer.hpp"

#include <algorithm>
#include <format>
#include <ostream>

namespace vshell {

HistoryBuffer::HistoryBuffer(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

void HistoryBuffer::push(std::string_view line) {
    entries_.emplace_back(line);
    while (entries_.size() > capacity_) {
        entries_.pop_front();
        ++dropped_;
    }
}

void HistoryBuffer::clear() noexcept {
    entries_.clear();
    dropped_ = 0;
}

void HistoryBuffer::set_capacity(std::size_t capacity) {
    capacity_ = std::max<std::size_t>(capacity, 1);
    while (entries_.size() > capacity_) {
        entries_.pop_front();
        ++dropped_;
    }
}

std::vector<std::string> HistoryBuffer::entries() const { return {entries_.begin(), entries_.end()}; }

void HistoryBuffer::print(std::ostream &out, std::size_t limit) const {
    const std::size_t total = entries_.size();
    const std::size_t start = limit < total ? total - limit : 0;

    for (std::size_t i = start; i < total; ++i) {
        out << std::format("{:>5}  {}\n", dropped_ + i + 1, entries_[i]);
    }
}

} // namespace vshell
