#pragma once

#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace vshell {

using StringList = std::vector<std::string>;
using PairList = std::vector<std::pair<std::string, std::string>>;
using StateValue = std::variant<std::string, StringList, PairList>;

// Key/value state owned by one namespace, e.g. a console session.
class StateStore {
  public:
    explicit StateStore(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] const std::string &name() const noexcept { return name_; }

    void set(std::string_view key, StateValue value);
    bool erase(std::string_view key);
    void clear() noexcept { values_.clear(); }

    [[nodiscard]] bool contains(std::string_view key) const { return values_.contains(key); }
    [[nodiscard]] const StateValue *get(std::string_view key) const;
    [[nodiscard]] std::optional<std::string> get_string(std::string_view key) const;
    [[nodiscard]] std::optional<StringList> get_list(std::string_view key) const;
    [[nodiscard]] std::optional<PairList> get_pairs(std::string_view key) const;

    [[nodiscard]] std::vector<std::string> keys() const;
    [[nodiscard]] const std::map<std::string, StateValue, std::less<>> &values() const noexcept { return values_; }

  private:
    std::string name_;
    std::map<std::string, StateValue, std::less<>> values_;
};

// Stores indexed by namespace string. Child namespaces are plain keys such
// as "console-1"; stores hold no references to each other.
class StateArena {
  public:
    StateStore &store(std::string_view name);
    [[nodiscard]] StateStore *find(std::string_view name);
    [[nodiscard]] bool contains(std::string_view name) const;
    bool remove(std::string_view name);
    [[nodiscard]] std::vector<std::string> namespaces() const;

    // One record per line: "<namespace>:<key>\t<type>\t<field>...", fields
    // escaped so that tabs and newlines never appear raw.
    std::expected<void, std::string> save(const std::filesystem::path &file) const;
    // A missing file is an empty arena.
    std::expected<void, std::string> load(const std::filesystem::path &file);

  private:
    std::map<std::string, std::unique_ptr<StateStore>, std::less<>> stores_;
    mutable std::mutex mutex_;
};

} // namespace vshell
