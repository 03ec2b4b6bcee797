#pragma once
#include "history.hpp"
#include <string>
#include <vector>

using RankedList = std::vector<CommandEntry>;

// Weights shared by both ranking modes
constexpr double RECENCY_WEIGHT = 0.6;
constexpr double FREQUENCY_WEIGHT = 0.4;

// 1 / (1 + log10(seconds since timestamp)), measured in whole seconds.
double recency_weight(TimePoint timestamp, TimePoint now);

// 1.0 for a prefix match, 0.5 - pos/len for a later match, 0.0 for no match.
double match_score(const std::string& command, const std::string& lowered_query);

std::string to_lower(const std::string& s);

RankedList search_commands(const std::string& query, const History& history,
                           size_t limit, TimePoint now);
RankedList search_commands(const std::string& query, const History& history,
                           size_t limit);

RankedList most_frequent(const History& history, size_t limit, TimePoint now);
RankedList most_frequent(const History& history, size_t limit);
