#pragma once

#include <vector>

#include "core/agent.hpp"

namespace agentdeck {

// Largest start-time gap for merging a placeholder into a row that shares no correlation id
constexpr int64_t kPlaceholderMergeWindowMs = 120000;

// Merges the records of one logical sub-agent into a single canonical record.
//
// Records sharing a correlation id are one group. Without a shared id, a record
// with the eager placeholder shape merges into the same-named row started within
// kPlaceholderMergeWindowMs. Records with no group pass through unchanged and in
// order. When nothing merges the input storage is returned as is.
std::vector<Agent> deduplicate_agents(std::vector<Agent> agents);

// true when the placeholder heuristic would merge the two records
bool is_placeholder_merge_candidate(const Agent &a, const Agent &b);

}  // namespace agentdeck
