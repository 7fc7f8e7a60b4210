#include <diagram_placement/ranking.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_set>

namespace diagram_placement {

namespace {

class RankSolver {
public:
    RankSolver(const std::vector<std::string>& node_ids,
        const std::vector<std::pair<std::string, std::string>>& edges)
    {
        const std::unordered_set<std::string> known(node_ids.begin(), node_ids.end());
        for (const auto& [from, to] : edges) {
            if (from == to) continue;
            if (!known.count(from) || !known.count(to)) continue;
            predecessors_[to].push_back(from);
        }
    }

    int rank_of(const std::string& id) {
        if (auto it = ranks_.find(id); it != ranks_.end()) return it->second;
        if (in_progress_.count(id)) {
            spdlog::warn("rank cycle through node {}, treating it as rank 0", id);
            return 0;
        }
        in_progress_.insert(id);
        int rank = 0;
        if (auto it = predecessors_.find(id); it != predecessors_.end()) {
            for (const auto& pred : it->second) rank = std::max(rank, rank_of(pred) + 1);
        }
        in_progress_.erase(id);
        ranks_[id] = rank;
        return rank;
    }

    RankMap take() { return std::move(ranks_); }

private:
    std::unordered_map<std::string, std::vector<std::string>> predecessors_;
    std::unordered_set<std::string> in_progress_;
    RankMap ranks_;
};

} // namespace

RankMap assign_ranks(const std::vector<std::string>& node_ids,
    const std::vector<std::pair<std::string, std::string>>& edges)
{
    RankSolver solver(node_ids, edges);
    for (const auto& id : node_ids) solver.rank_of(id);
    return solver.take();
}

} // namespace diagram_placement
