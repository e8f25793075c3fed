// === src/IncludeAggregator/IncludeAggregator.cpp ===
#include "IncludeAggregator.hpp"
#include <algorithm>
#include <unordered_map>

// Desc: group contributions by prefix and rank groups by count and by size
// In: const std::vector<IncludeContribution>& contributions, size_t top_n
// Out: IncludeRankings (each list at most top_n long)
IncludeRankings IncludeAggregator::aggregate(const std::vector<IncludeContribution>& contributions,
                                             size_t top_n) {
    IncludeRankings out;
    if (contributions.empty() || top_n == 0) return out;

    // groups kept in first-seen order; index map points into it
    std::vector<IncludeStats> groups;
    std::unordered_map<std::string, size_t> index;
    index.reserve(contributions.size());

    for (const auto& c : contributions) {
        auto it = index.find(c.path_prefix);
        if (it == index.end()) {
            index.emplace(c.path_prefix, groups.size());
            groups.push_back(IncludeStats{c.path_prefix, 1, c.size_bytes});
        } else {
            IncludeStats& g = groups[it->second];
            g.count += 1;
            g.lines += c.size_bytes;
        }
    }

    // stable_sort keeps first-seen order for ties
    out.by_count = groups;
    std::stable_sort(out.by_count.begin(), out.by_count.end(),
                     [](const IncludeStats& a, const IncludeStats& b) { return a.count > b.count; });
    if (out.by_count.size() > top_n) out.by_count.resize(top_n);

    out.by_size = std::move(groups);
    std::stable_sort(out.by_size.begin(), out.by_size.end(),
                     [](const IncludeStats& a, const IncludeStats& b) { return a.lines > b.lines; });
    if (out.by_size.size() > top_n) out.by_size.resize(top_n);

    return out;
}

// Desc: derive grouping prefix (parent dir, at most `depth` components)
// In: const std::string& include_path, size_t depth
// Out: std::string ("." when the path has no directory part)
std::string IncludeAggregator::prefix_of(const std::string& include_path, size_t depth) {
    const auto slash = include_path.rfind('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";

    const std::string dir = include_path.substr(0, slash);
    const bool absolute = dir[0] == '/';

    // walk components, stop after `depth` of them
    size_t seen = 0;
    size_t pos = absolute ? 1 : 0;
    while (pos < dir.size()) {
        size_t next = dir.find('/', pos);
        if (next == std::string::npos) next = dir.size();
        if (next > pos) {
            ++seen;
            if (seen == depth) return dir.substr(0, next);
        }
        pos = next + 1;
    }
    return dir;
}

// Desc: map (included path, size) pairs into contributions keyed by prefix
// In: const std::vector<std::pair<std::string, uint64_t>>& files, size_t depth
// Out: std::vector<IncludeContribution>
std::vector<IncludeContribution>
IncludeAggregator::contributions_from(const std::vector<std::pair<std::string, uint64_t>>& files,
                                      size_t depth) {
    std::vector<IncludeContribution> out;
    out.reserve(files.size());
    for (const auto& [path, size] : files) {
        out.push_back(IncludeContribution{prefix_of(path, depth), size});
    }
    return out;
}
