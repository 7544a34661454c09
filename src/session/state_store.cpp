#include "session/state_store.hpp"

#include <format>
#include <fstream>
#include <system_error>

namespace vshell {

namespace {

[[nodiscard]] std::string escape_field(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());

    for (const char c : text) {
        switch (c) {
        case '\\':
            escaped += "\\\\";
            break;
        case '\t':
            escaped += "\\t";
            break;
        case '\n':
            escaped += "\\n";
            break;
        case '\r':
            escaped += "\\r";
            break;
        default:
            escaped.push_back(c);
        }
    }

    return escaped;
}

[[nodiscard]] std::string unescape_field(std::string_view text) {
    std::string plain;
    plain.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\' || i + 1 == text.size()) {
            plain.push_back(text[i]);
            continue;
        }

        switch (text[++i]) {
        case 't':
            plain.push_back('\t');
            break;
        case 'n':
            plain.push_back('\n');
            break;
        case 'r':
            plain.push_back('\r');
            break;
        default:
            plain.push_back(text[i]);
        }
    }

    return plain;
}

[[nodiscard]] std::vector<std::string> split_fields(std::string_view line) {
    std::vector<std::string> fields;
    std::size_t start = 0;

    while (true) {
        const std::size_t tab = line.find('\t', start);
        fields.push_back(unescape_field(line.substr(start, tab == std::string_view::npos ? tab : tab - start)));
        if (tab == std::string_view::npos) {
            break;
        }
        start = tab + 1;
    }

    return fields;
}

struct RecordWriter {
    std::ofstream &out;
    const std::string &label;

    void operator()(const std::string &value) const { out << label << "\tstring\t" << escape_field(value) << '\n'; }

    void operator()(const StringList &items) const {
        out << label << "\tlist";
        for (const auto &item : items) {
            out << '\t' << escape_field(item);
        }
        out << '\n';
    }

    void operator()(const PairList &pairs) const {
        out << label << "\tpairs";
        for (const auto &[key, value] : pairs) {
            out << '\t' << escape_field(key) << '\t' << escape_field(value);
        }
        out << '\n';
    }
};

} // namespace

void StateStore::set(std::string_view key, StateValue value) { values_.insert_or_assign(std::string(key), std::move(value)); }

bool StateStore::erase(std::string_view key) {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return false;
    }
    values_.erase(it);
    return true;
}

const StateValue *StateStore::get(std::string_view key) const {
    auto it = values_.find(key);
    return it == values_.end() ? nullptr : &it->second;
}

std::optional<std::string> StateStore::get_string(std::string_view key) const {
    const StateValue *value = get(key);
    if (value == nullptr || !std::holds_alternative<std::string>(*value)) {
        return std::nullopt;
    }
    return std::get<std::string>(*value);
}

std::optional<StringList> StateStore::get_list(std::string_view key) const {
    const StateValue *value = get(key);
    if (value == nullptr || !std::holds_alternative<StringList>(*value)) {
        return std::nullopt;
    }
    return std::get<StringList>(*value);
}

std::optional<PairList> StateStore::get_pairs(std::string_view key) const {
    const StateValue *value = get(key);
    if (value == nullptr || !std::holds_alternative<PairList>(*value)) {
        return std::nullopt;
    }
    return std::get<PairList>(*value);
}

std::vector<std::string> StateStore::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto &[key, _] : values_) {
        result.push_back(key);
    }
    return result;
}

StateStore &StateArena::store(std::string_view name) {
    std::lock_guard lock(mutex_);

    auto it = stores_.find(name);
    if (it == stores_.end()) {
        it = stores_.emplace(std::string(name), std::make_unique<StateStore>(std::string(name))).first;
    }
    return *it->second;
}

StateStore *StateArena::find(std::string_view name) {
    std::lock_guard lock(mutex_);
    auto it = stores_.find(name);
    return it == stores_.end() ? nullptr : it->second.get();
}

bool StateArena::contains(std::string_view name) const {
    std::lock_guard lock(mutex_);
    return stores_.contains(name);
}

bool StateArena::remove(std::string_view name) {
    std::lock_guard lock(mutex_);
    auto it = stores_.find(name);
    if (it == stores_.end()) {
        return false;
    }
    stores_.erase(it);
    return true;
}

std::vector<std::string> StateArena::namespaces() const {
    std::lock_guard lock(mutex_);

    std::vector<std::string> names;
    names.reserve(stores_.size());
    for (const auto &[name, _] : stores_) {
        names.push_back(name);
    }
    return names;
}

std::expected<void, std::string> StateArena::save(const std::filesystem::path &file) const {
    std::lock_guard lock(mutex_);

    std::ofstream out(file, std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected(std::format("cannot open '{}' for writing", file.string()));
    }

    for (const auto &[name, store] : stores_) {
        for (const auto &[key, value] : store->values()) {
            const std::string label = escape_field(std::format("{}:{}", name, key));
            std::visit(RecordWriter{.out = out, .label = label}, value);
        }
    }

    out.flush();
    if (!out) {
        return std::unexpected(std::format("failed to write '{}'", file.string()));
    }
    return {};
}

std::expected<void, std::string> StateArena::load(const std::filesystem::path &file) {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        return {};
    }

    std::ifstream in(file);
    if (!in.is_open()) {
        return std::unexpected(std::format("cannot open '{}' for reading", file.string()));
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }

        const auto fields = split_fields(line);
        const std::size_t colon = fields[0].find(':');
        if (fields.size() < 2 || colon == std::string::npos || colon == 0) {
            return std::unexpected(std::format("{}:{}: malformed record", file.string(), line_number));
        }

        StateStore &target = store(std::string_view(fields[0]).substr(0, colon));
        const std::string key = fields[0].substr(colon + 1);
        const std::string &type = fields[1];

        if (type == "string") {
            target.set(key, fields.size() > 2 ? fields[2] : std::string{});
        } else if (type == "list") {
            target.set(key, StringList(fields.begin() + 2, fields.end()));
        } else if (type == "pairs") {
            if (fields.size() % 2 != 0) {
                return std::unexpected(std::format("{}:{}: unpaired field", file.string(), line_number));
            }
            PairList pairs;
            for (std::size_t i = 2; i + 1 < fields.size(); i += 2) {
                pairs.emplace_back(fields[i], fields[i + 1]);
            }
            target.set(key, std::move(pairs));
        } else {
            return std::unexpected(std::format("{}:{}: unknown value type '{}'", file.string(), line_number, type));
        }
    }

    return {};
}

} // namespace vshell
