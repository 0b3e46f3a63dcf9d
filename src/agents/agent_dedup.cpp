#include "agents/agent_dedup.hpp"

#include <map>
#include <numeric>
#include <set>
#include <string>

namespace agentdeck {

namespace {

class DisjointSet {
 public:
  explicit DisjointSet(size_t n) : parent_(n) {
    std::iota(parent_.begin(), parent_.end(), 0);
  }

  size_t find(size_t i) {
    while (parent_[i] != i) {
      parent_[i] = parent_[parent_[i]];
      i = parent_[i];
    }
    return i;
  }

  // The smaller index stays the root so a group is emitted at its first appearance
  void unite(size_t a, size_t b) {
    a = find(a);
    b = find(b);
    if (a == b) return;
    if (b < a) std::swap(a, b);
    parent_[b] = a;
  }

 private:
  std::vector<size_t> parent_;
};

bool id_differs_from_correlation(const Agent &agent) {
  return !agent.correlation_id || agent.id != *agent.correlation_id;
}

// Higher is a better canonical identity: task-bearing SDK row > SDK row > placeholder
int canonical_rank(const Agent &agent) {
  if (!id_differs_from_correlation(agent)) return 0;
  return is_generic_task(agent.task) ? 1 : 2;
}

Agent merge_group(const std::vector<Agent> &agents, const std::vector<size_t> &members) {
  size_t canonical = members.front();
  for (size_t index : members) {
    // Ties go to the most recently observed record
    if (canonical_rank(agents[index]) >= canonical_rank(agents[canonical])) {
      canonical = index;
    }
  }

  Agent merged = agents[canonical];

  const Agent *latest_terminal = nullptr;
  std::optional<EpochMs> earliest_start;
  for (size_t index : members) {
    const Agent &member = agents[index];

    if (is_generic_task(merged.task) && !is_generic_task(member.task)) {
      merged.task = member.task;
    }
    if (member.tool_uses && (!merged.tool_uses || *member.tool_uses > *merged.tool_uses)) {
      merged.tool_uses = member.tool_uses;
    }
    if (is_terminal_status(member.status)) {
      latest_terminal = &member;
    }
    if (!merged.correlation_id && member.correlation_id) {
      merged.correlation_id = member.correlation_id;
    }
    if (!merged.model && member.model) {
      merged.model = member.model;
    }
    if (is_background_agent(member)) {
      merged.background = true;
    }
    if (!merged.result && member.result) {
      merged.result = member.result;
    }
    if (!merged.error && member.error) {
      merged.error = member.error;
    }

    auto started = parse_timestamp_ms(member.started_at);
    if (started && (!earliest_start || *started < *earliest_start)) {
      earliest_start = started;
      merged.started_at = member.started_at;
    }
  }

  if (latest_terminal) {
    merged.status = latest_terminal->status;
    merged.current_tool.reset();
    if (latest_terminal->result) merged.result = latest_terminal->result;
    if (latest_terminal->error) merged.error = latest_terminal->error;
    if (latest_terminal->duration_ms) merged.duration_ms = latest_terminal->duration_ms;
  } else {
    if (!merged.current_tool || merged.current_tool->empty()) {
      for (auto it = members.rbegin(); it != members.rend(); ++it) {
        const auto &tool = agents[*it].current_tool;
        if (tool && !tool->empty()) {
          merged.current_tool = tool;
          break;
        }
      }
    }
    if (merged.status == AgentStatus::Pending) {
      for (size_t index : members) {
        if (agents[index].status == AgentStatus::Running) {
          merged.status = AgentStatus::Running;
          break;
        }
      }
    }
  }

  return normalize_agent(std::move(merged));
}

}  // namespace

bool is_placeholder_merge_candidate(const Agent &a, const Agent &b) {
  if (a.name != b.name) return false;
  if (has_eager_placeholder_shape(a) == has_eager_placeholder_shape(b)) return false;
  if (a.correlation_id && b.correlation_id && *a.correlation_id != *b.correlation_id) return false;

  auto a_start = parse_timestamp_ms(a.started_at);
  auto b_start = parse_timestamp_ms(b.started_at);
  if (!a_start || !b_start) return false;
  auto gap = *a_start > *b_start ? *a_start - *b_start : *b_start - *a_start;
  return gap <= kPlaceholderMergeWindowMs;
}

std::vector<Agent> deduplicate_agents(std::vector<Agent> agents) {
  if (agents.size() <= 1) {
    return agents;
  }

  const size_t n = agents.size();
  DisjointSet groups(n);

  // 1. Shared correlation id, or a placeholder id equal to another record's correlation id
  std::map<std::string, size_t> by_correlation;
  for (size_t i = 0; i < n; ++i) {
    if (agents[i].correlation_id) {
      auto [it, inserted] = by_correlation.emplace(*agents[i].correlation_id, i);
      if (!inserted) groups.unite(it->second, i);
    }
  }
  for (size_t i = 0; i < n; ++i) {
    auto it = by_correlation.find(agents[i].id);
    if (it != by_correlation.end()) groups.unite(it->second, i);
  }

  auto group_correlation = [&](size_t root) -> std::optional<std::string> {
    for (size_t i = 0; i < n; ++i) {
      if (groups.find(i) == root && agents[i].correlation_id) return agents[i].correlation_id;
    }
    return std::nullopt;
  };
  auto group_has_descriptive_row = [&](size_t root) {
    for (size_t i = 0; i < n; ++i) {
      if (groups.find(i) == root && !has_eager_placeholder_shape(agents[i])) return true;
    }
    return false;
  };

  // 2. Placeholder heuristic for records that share no correlation id
  std::set<size_t> absorbed;
  for (size_t p = 0; p < n; ++p) {
    if (!has_eager_placeholder_shape(agents[p]) || absorbed.count(p)) continue;
    if (group_has_descriptive_row(groups.find(p))) continue;

    for (size_t row = 0; row < n; ++row) {
      if (row == p || groups.find(row) == groups.find(p)) continue;
      if (!is_placeholder_merge_candidate(agents[p], agents[row])) continue;

      auto p_corr = group_correlation(groups.find(p));
      auto row_corr = group_correlation(groups.find(row));
      if (p_corr && row_corr && *p_corr != *row_corr) continue;

      groups.unite(p, row);
      absorbed.insert(p);
      break;
    }
  }

  std::map<size_t, std::vector<size_t>> members;
  for (size_t i = 0; i < n; ++i) {
    members[groups.find(i)].push_back(i);
  }
  if (members.size() == n) {
    return agents;
  }

  std::vector<Agent> result;
  result.reserve(members.size());
  for (size_t i = 0; i < n; ++i) {
    const auto &group = members[groups.find(i)];
    if (group.front() != i) continue;
    if (group.size() == 1) {
      result.push_back(std::move(agents[i]));
    } else {
      result.push_back(merge_group(agents, group));
    }
  }
  return result;
}

}  // namespace agentdeck
