#include "vfs/path.hpp"

namespace vshell::paths {

std::vector<std::string> split(std::string_view path) {
    std::vector<std::string> segments;
    std::size_t start = 0;

    while (start <= path.size()) {
        const auto slash = path.find('/', start);
        const auto end = slash == std::string_view::npos ? path.size() : slash;
        if (end > start) {
            segments.emplace_back(path.substr(start, end - start));
        }
        if (slash == std::string_view::npos) {
            break;
        }
        start = slash + 1;
    }

    return segments;
}

std::string resolve(std::string_view path) {
    std::vector<std::string> kept;

    for (auto &segment : split(path)) {
        if (segment == ".") {
            continue;
        }

        if (segment == "..") {
            if (!kept.empty()) {
                kept.pop_back();
            }
            continue;
        }

        kept.push_back(std::move(segment));
    }

    if (kept.empty()) {
        return "/";
    }

    std::string resolved;
    for (const auto &segment : kept) {
        resolved.push_back('/');
        resolved += segment;
    }
    return resolved;
}

std::string resolve_from(std::string_view base, std::string_view path) {
    if (!path.empty() && path.front() == '/') {
        return resolve(path);
    }
    return join(base, path);
}

std::string join(std::string_view left, std::string_view right) {
    std::string joined(left);
    joined.push_back('/');
    joined += right;
    return resolve(joined);
}

std::string dirname(std::string_view path) {
    const std::string resolved = resolve(path);
    const auto last_slash = resolved.rfind('/');
    if (last_slash == 0) {
        return "/";
    }
    return resolved.substr(0, last_slash);
}

std::string basename(std::string_view path, std::string_view strip_extension) {
    const std::string resolved = resolve(path);
    std::string name = resolved.substr(resolved.rfind('/') + 1);

    if (!strip_extension.empty() && name.size() > strip_extension.size() && name.ends_with(strip_extension)) {
        name.resize(name.size() - strip_extension.size());
    }

    return name;
}

std::string extname(std::string_view path) {
    const std::string name = basename(path);
    const auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    return name.substr(dot);
}

bool is_within(std::string_view path, std::string_view ancestor) noexcept {
    if (ancestor == "/") {
        return true;
    }
    if (!path.starts_with(ancestor)) {
        return false;
    }
    return path.size() == ancestor.size() || path[ancestor.size()] == '/';
}

std::string relative_to(std::string_view path, std::string_view ancestor) {
    if (ancestor == "/" || path.size() == ancestor.size()) {
        return ancestor == "/" ? std::string(path) : "/";
    }
    return std::string(path.substr(ancestor.size()));
}

} // namespace vshell::paths
