#include "search.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>

namespace {

struct Scored {
    std::string cmd;
    double score;
};

// Stable sort keeps first-seen order on ties.
RankedList take_top(std::vector<Scored>& scored, size_t limit) {
    std::stable_sort(scored.begin(), scored.end(),
                     [](const Scored& a, const Scored& b) { return a.score > b.score; });

    RankedList results;
    results.reserve(std::min(limit, scored.size()));
    for (auto& s : scored) {
        if (results.size() >= limit) break;
        results.push_back({std::move(s.cmd), TimePoint{}});
    }
    return results;
}

} // namespace

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

double recency_weight(TimePoint timestamp, TimePoint now) {
    auto seconds_ago = std::chrono::duration_cast<std::chrono::seconds>(now - timestamp).count();
    double weight = 1.0 / (1.0 + std::log10(static_cast<double>(seconds_ago)));
    // Timestamps in the future give NaN; they carry no recency.
    if (!std::isfinite(weight)) return 0.0;
    return weight;
}

double match_score(const std::string& command, const std::string& lowered_query) {
    size_t pos = to_lower(command).find(lowered_query);
    if (pos == std::string::npos) return 0.0;
    if (pos == 0) return 1.0;
    return 0.5 - static_cast<double>(pos) / static_cast<double>(command.size());
}

RankedList search_commands(const std::string& query, const History& history,
                           size_t limit, TimePoint now) {
    spdlog::debug("Search commands with term: {}", query);

    const std::string term = to_lower(query);

    // Best total per unique command, in first-seen order
    std::vector<Scored> scored;
    std::unordered_map<std::string, size_t> index;

    for (const auto& entry : history.entries()) {
        double match = match_score(entry.command, term);
        if (match <= 0.0) continue;

        double recency = recency_weight(entry.timestamp, now);

        // Running baseline: a repeat builds on the command's best score so far
        auto it = index.find(entry.command);
        double frequency = (it == index.end()) ? 1.0 : scored[it->second].score + 1.0;

        double total = match * (RECENCY_WEIGHT * recency + FREQUENCY_WEIGHT * frequency);

        if (it == index.end()) {
            index.emplace(entry.command, scored.size());
            scored.push_back({entry.command, total});
        } else {
            double& best = scored[it->second].score;
            best = std::max(best, total);
        }
    }

    return take_top(scored, limit);
}

RankedList search_commands(const std::string& query, const History& history, size_t limit) {
    return search_commands(query, history, limit, std::chrono::system_clock::now());
}

RankedList most_frequent(const History& history, size_t limit, TimePoint now) {
    spdlog::debug("Get frequent commands");

    struct Usage {
        std::string cmd;
        size_t count;
        TimePoint latest;
    };

    std::vector<Usage> usage;
    std::unordered_map<std::string, size_t> index;

    for (const auto& entry : history.entries()) {
        auto it = index.find(entry.command);
        if (it == index.end()) {
            index.emplace(entry.command, usage.size());
            usage.push_back({entry.command, 1, entry.timestamp});
            continue;
        }
        Usage& u = usage[it->second];
        u.count++;
        if (entry.timestamp > u.latest) u.latest = entry.timestamp;
    }

    std::vector<Scored> scored;
    scored.reserve(usage.size());
    for (auto& u : usage) {
        double total = RECENCY_WEIGHT * recency_weight(u.latest, now) +
                       FREQUENCY_WEIGHT * static_cast<double>(u.count);
        scored.push_back({std::move(u.cmd), total});
    }

    return take_top(scored, limit);
}

RankedList most_frequent(const History& history, size_t limit) {
    return most_frequent(history, limit, std::chrono::system_clock::now());
}
