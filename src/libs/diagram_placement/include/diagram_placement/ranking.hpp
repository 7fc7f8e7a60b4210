#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace diagram_placement {

using RankMap = std::unordered_map<std::string, int>;

// Longest-path layering: nodes without predecessors get rank 0, every other
// node 1 + the largest predecessor rank. Self edges and edges touching nodes
// outside node_ids are ignored. A node reached again while its own rank is
// still being computed (a cycle) counts as rank 0 for that lookup.
RankMap assign_ranks(const std::vector<std::string>& node_ids,
    const std::vector<std::pair<std::string, std::string>>& edges);

} // namespace diagram_placement
