#pragma once

#include <cstddef>
#include <deque>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace vshell {

// Bounded command history; the oldest entry is dropped once full.
class HistoryBuffer {
  public:
    static constexpr std::size_t kDefaultCapacity = 1000;

    explicit HistoryBuffer(std::size_t capacity = kDefaultCapacity);

    void push(std::string_view line);
    void clear() noexcept;
    void set_capacity(std::size_t capacity);

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    // Oldest first.
    [[nodiscard]] std::vector<std::string> entries() const;
    [[nodiscard]] const std::string &at(std::size_t index) const { return entries_.at(index); }
    [[nodiscard]] const std::string &back() const { return entries_.back(); }

    // Numbered like bash: "    1  ls". `limit` keeps only the newest lines.
    void print(std::ostream &out, std::size_t limit) const;

  private:
    std::deque<std::string> entries_;
    std::size_t capacity_;
    // Number of entries ever dropped, so numbering stays stable.
    std::size_t dropped_{0};
};

} // namespace vshell
