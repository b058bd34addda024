#pragma once

#include <cstdint>
#include <vector>

namespace swisspair::core::matching {

// Maximum weighted matching on a general undirected graph (Edmonds' blossom
// algorithm with dual variables). Among all maximum-cardinality matchings the
// one of greatest total weight is produced. A weight of zero means "no edge".
class MatchingComputer {
public:
    using Weight = std::int64_t;

    MatchingComputer(int vertex_count, Weight max_edge_weight);

    int vertex_count() const { return vertex_count_; }
    Weight max_edge_weight() const { return max_edge_weight_; }

    void SetEdgeWeight(int u, int v, Weight weight);
    Weight EdgeWeight(int u, int v) const;

    void ComputeMatching();

    // matching[i] is the partner of vertex i, or -1.
    const std::vector<int>& GetMatching() const { return matching_; }
    bool IsComplete() const;
    int MatchingSize() const;
    Weight MatchingWeight() const;

private:
    struct Edge {
        int u = 0;
        int v = 0;
        Weight weight = 0;
    };

    void ResetSearchState();
    Weight Slack(int k) const;
    void CollectLeaves(int b, std::vector<int>& out) const;
    std::vector<int> Leaves(int b) const;
    void AssignLabel(int w, int t, int p);
    int ScanBlossom(int v, int w);
    void AddBlossom(int base, int k);
    void ExpandBlossom(int b, bool endstage);
    void AugmentBlossom(int b, int v);
    void AugmentMatching(int k);
    bool RunStage();

    int vertex_count_ = 0;
    Weight max_edge_weight_ = 0;
    std::vector<Weight> weights_;
    std::vector<int> matching_;

    // Search state, valid during ComputeMatching().
    std::vector<Edge> edges_;
    std::vector<int> endpoint_;
    std::vector<std::vector<int>> neighbend_;
    std::vector<int> mate_;
    std::vector<int> label_;
    std::vector<int> labelend_;
    std::vector<int> inblossom_;
    std::vector<int> blossomparent_;
    std::vector<std::vector<int>> blossomchilds_;
    std::vector<int> blossombase_;
    std::vector<std::vector<int>> blossomendps_;
    std::vector<int> bestedge_;
    std::vector<std::vector<int>> blossombestedges_;
    std::vector<bool> has_blossombestedges_;
    std::vector<int> unusedblossoms_;
    std::vector<Weight> dualvar_;
    std::vector<bool> allowedge_;
    std::vector<int> queue_;
};

}  // namespace swisspair::core::matching
