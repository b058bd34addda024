#include "swisspair/core/matching/MatchingComputer.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace swisspair::core::matching {

namespace {

// Cyclic index into a blossom's child or endpoint list; the augmenting walks
// step in both directions and may go below zero.
template <typename T>
T& Cyclic(std::vector<T>& values, int index) {
    const int size = static_cast<int>(values.size());
    return values[static_cast<size_t>(((index % size) + size) % size)];
}

int IndexOf(const std::vector<int>& values, int value) {
    const auto it = std::find(values.begin(), values.end(), value);
    return static_cast<int>(it - values.begin());
}

}  // namespace

MatchingComputer::MatchingComputer(int vertex_count, Weight max_edge_weight)
    : vertex_count_(vertex_count), max_edge_weight_(max_edge_weight) {
    if (vertex_count < 0) {
        throw std::invalid_argument("Vertex count must not be negative");
    }
    weights_.assign(static_cast<size_t>(vertex_count) * static_cast<size_t>(vertex_count), 0);
    matching_.assign(static_cast<size_t>(vertex_count), -1);
}

void MatchingComputer::SetEdgeWeight(int u, int v, Weight weight) {
    if (u < 0 || v < 0 || u >= vertex_count_ || v >= vertex_count_) {
        throw std::out_of_range("Vertex index out of bounds: " + std::to_string(u) + ", " +
                                std::to_string(v));
    }
    if (u == v) {
        throw std::invalid_argument("Self loops are not allowed");
    }
    if (weight < 0 || weight > max_edge_weight_) {
        throw std::invalid_argument("Edge weight " + std::to_string(weight) +
                                    " outside [0, " + std::to_string(max_edge_weight_) + "]");
    }
    const size_t n = static_cast<size_t>(vertex_count_);
    weights_[static_cast<size_t>(u) * n + static_cast<size_t>(v)] = weight;
    weights_[static_cast<size_t>(v) * n + static_cast<size_t>(u)] = weight;
}

MatchingComputer::Weight MatchingComputer::EdgeWeight(int u, int v) const {
    const size_t n = static_cast<size_t>(vertex_count_);
    return weights_[static_cast<size_t>(u) * n + static_cast<size_t>(v)];
}

bool MatchingComputer::IsComplete() const {
    return std::none_of(matching_.begin(), matching_.end(), [](int mate) { return mate < 0; });
}

int MatchingComputer::MatchingSize() const {
    int count = 0;
    for (int i = 0; i < vertex_count_; ++i) {
        if (matching_[static_cast<size_t>(i)] > i) {
            ++count;
        }
    }
    return count;
}

MatchingComputer::Weight MatchingComputer::MatchingWeight() const {
    Weight total = 0;
    for (int i = 0; i < vertex_count_; ++i) {
        const int mate = matching_[static_cast<size_t>(i)];
        if (mate > i) {
            total += EdgeWeight(i, mate);
        }
    }
    return total;
}

MatchingComputer::Weight MatchingComputer::Slack(int k) const {
    const Edge& edge = edges_[static_cast<size_t>(k)];
    return dualvar_[static_cast<size_t>(edge.u)] + dualvar_[static_cast<size_t>(edge.v)] -
           2 * edge.weight;
}

void MatchingComputer::CollectLeaves(int b, std::vector<int>& out) const {
    if (b < vertex_count_) {
        out.push_back(b);
        return;
    }
    for (int child : blossomchilds_[static_cast<size_t>(b)]) {
        CollectLeaves(child, out);
    }
}

std::vector<int> MatchingComputer::Leaves(int b) const {
    std::vector<int> leaves;
    CollectLeaves(b, leaves);
    return leaves;
}

void MatchingComputer::AssignLabel(int w, int t, int p) {
    const int b = inblossom_[w];
    label_[w] = label_[b] = t;
    labelend_[w] = labelend_[b] = p;
    bestedge_[w] = bestedge_[b] = -1;
    if (t == 1) {
        const auto leaves = Leaves(b);
        queue_.insert(queue_.end(), leaves.begin(), leaves.end());
    } else if (t == 2) {
        const int base = blossombase_[b];
        AssignLabel(endpoint_[mate_[base]], 1, mate_[base] ^ 1);
    }
}

int MatchingComputer::ScanBlossom(int v, int w) {
    std::vector<int> path;
    int base = -1;
    while (v != -1 || w != -1) {
        int b = inblossom_[v];
        if (label_[b] & 4) {
            base = blossombase_[b];
            break;
        }
        path.push_back(b);
        label_[b] = 5;
        if (labelend_[b] == -1) {
            v = -1;
        } else {
            v = endpoint_[labelend_[b]];
            b = inblossom_[v];
            v = endpoint_[labelend_[b]];
        }
        if (w != -1) {
            std::swap(v, w);
        }
    }
    for (int b : path) {
        label_[b] = 1;
    }
    return base;
}

void MatchingComputer::AddBlossom(int base, int k) {
    int v = edges_[k].u;
    int w = edges_[k].v;
    const int bb = inblossom_[base];
    int bv = inblossom_[v];
    int bw = inblossom_[w];

    const int b = unusedblossoms_.back();
    unusedblossoms_.pop_back();
    blossombase_[b] = base;
    blossomparent_[b] = -1;
    blossomparent_[bb] = b;

    auto& path = blossomchilds_[b];
    auto& endps = blossomendps_[b];
    path.clear();
    endps.clear();
    while (bv != bb) {
        blossomparent_[bv] = b;
        path.push_back(bv);
        endps.push_back(labelend_[bv]);
        v = endpoint_[labelend_[bv]];
        bv = inblossom_[v];
    }
    path.push_back(bb);
    std::reverse(path.begin(), path.end());
    std::reverse(endps.begin(), endps.end());
    endps.push_back(2 * k);
    while (bw != bb) {
        blossomparent_[bw] = b;
        path.push_back(bw);
        endps.push_back(labelend_[bw] ^ 1);
        w = endpoint_[labelend_[bw]];
        bw = inblossom_[w];
    }

    label_[b] = 1;
    labelend_[b] = labelend_[bb];
    dualvar_[b] = 0;
    for (int leaf : Leaves(b)) {
        if (label_[inblossom_[leaf]] == 2) {
            queue_.push_back(leaf);
        }
        inblossom_[leaf] = b;
    }

    std::vector<int> bestedgeto(static_cast<size_t>(2 * vertex_count_), -1);
    for (int child : path) {
        std::vector<std::vector<int>> nblists;
        if (!has_blossombestedges_[child]) {
            for (int leaf : Leaves(child)) {
                std::vector<int> list;
                for (int p : neighbend_[leaf]) {
                    list.push_back(p / 2);
                }
                nblists.push_back(std::move(list));
            }
        } else {
            nblists.push_back(blossombestedges_[child]);
        }
        for (const auto& nblist : nblists) {
            for (int edge : nblist) {
                int i = edges_[edge].u;
                int j = edges_[edge].v;
                if (inblossom_[j] == b) {
                    std::swap(i, j);
                }
                const int bj = inblossom_[j];
                if (bj != b && label_[bj] == 1 &&
                    (bestedgeto[bj] == -1 || Slack(edge) < Slack(bestedgeto[bj]))) {
                    bestedgeto[bj] = edge;
                }
            }
        }
        blossombestedges_[child].clear();
        has_blossombestedges_[child] = false;
        bestedge_[child] = -1;
    }

    blossombestedges_[b].clear();
    for (int edge : bestedgeto) {
        if (edge != -1) {
            blossombestedges_[b].push_back(edge);
        }
    }
    has_blossombestedges_[b] = true;
    bestedge_[b] = -1;
    for (int edge : blossombestedges_[b]) {
        if (bestedge_[b] == -1 || Slack(edge) < Slack(bestedge_[b])) {
            bestedge_[b] = edge;
        }
    }
}

void MatchingComputer::ExpandBlossom(int b, bool endstage) {
    for (int s : blossomchilds_[b]) {
        blossomparent_[s] = -1;
        if (s < vertex_count_) {
            inblossom_[s] = s;
        } else if (endstage && dualvar_[s] == 0) {
            ExpandBlossom(s, endstage);
        } else {
            for (int leaf : Leaves(s)) {
                inblossom_[leaf] = s;
            }
        }
    }

    if (!endstage && label_[b] == 2) {
        auto& childs = blossomchilds_[b];
        auto& endps = blossomendps_[b];
        const int entrychild = inblossom_[endpoint_[labelend_[b] ^ 1]];
        int j = IndexOf(childs, entrychild);
        int jstep = 0;
        int endptrick = 0;
        if (j & 1) {
            j -= static_cast<int>(childs.size());
            jstep = 1;
            endptrick = 0;
        } else {
            jstep = -1;
            endptrick = 1;
        }
        int p = labelend_[b];
        while (j != 0) {
            label_[endpoint_[p ^ 1]] = 0;
            label_[endpoint_[Cyclic(endps, j - endptrick) ^ endptrick ^ 1]] = 0;
            AssignLabel(endpoint_[p ^ 1], 2, p);
            allowedge_[Cyclic(endps, j - endptrick) / 2] = true;
            j += jstep;
            p = Cyclic(endps, j - endptrick) ^ endptrick;
            allowedge_[p / 2] = true;
            j += jstep;
        }
        int bv = Cyclic(childs, j);
        label_[endpoint_[p ^ 1]] = label_[bv] = 2;
        labelend_[endpoint_[p ^ 1]] = labelend_[bv] = p;
        bestedge_[bv] = -1;
        j += jstep;
        while (Cyclic(childs, j) != entrychild) {
            bv = Cyclic(childs, j);
            if (label_[bv] == 1) {
                j += jstep;
                continue;
            }
            int labelled = -1;
            for (int leaf : Leaves(bv)) {
                if (label_[leaf] != 0) {
                    labelled = leaf;
                    break;
                }
            }
            if (labelled != -1) {
                label_[labelled] = 0;
                label_[endpoint_[mate_[blossombase_[bv]]]] = 0;
                AssignLabel(labelled, 2, labelend_[labelled]);
            }
            j += jstep;
        }
    }

    label_[b] = labelend_[b] = -1;
    blossomchilds_[b].clear();
    blossomendps_[b].clear();
    blossombase_[b] = -1;
    blossombestedges_[b].clear();
    has_blossombestedges_[b] = false;
    bestedge_[b] = -1;
    unusedblossoms_.push_back(b);
}

void MatchingComputer::AugmentBlossom(int b, int v) {
    int t = v;
    while (blossomparent_[t] != b) {
        t = blossomparent_[t];
    }
    if (t >= vertex_count_) {
        AugmentBlossom(t, v);
    }

    auto& childs = blossomchilds_[b];
    auto& endps = blossomendps_[b];
    const int i = IndexOf(childs, t);
    int j = i;
    int jstep = 0;
    int endptrick = 0;
    if (i & 1) {
        j -= static_cast<int>(childs.size());
        jstep = 1;
        endptrick = 0;
    } else {
        jstep = -1;
        endptrick = 1;
    }
    while (j != 0) {
        j += jstep;
        t = Cyclic(childs, j);
        const int p = Cyclic(endps, j - endptrick) ^ endptrick;
        if (t >= vertex_count_) {
            AugmentBlossom(t, endpoint_[p]);
        }
        j += jstep;
        t = Cyclic(childs, j);
        if (t >= vertex_count_) {
            AugmentBlossom(t, endpoint_[p ^ 1]);
        }
        mate_[endpoint_[p]] = p ^ 1;
        mate_[endpoint_[p ^ 1]] = p;
    }

    std::rotate(childs.begin(), childs.begin() + i, childs.end());
    std::rotate(endps.begin(), endps.begin() + i, endps.end());
    blossombase_[b] = blossombase_[childs.front()];
}

void MatchingComputer::AugmentMatching(int k) {
    const int v = edges_[k].u;
    const int w = edges_[k].v;
    const int starts[2][2] = {{v, 2 * k + 1}, {w, 2 * k}};
    for (const auto& start : starts) {
        int s = start[0];
        int p = start[1];
        while (true) {
            const int bs = inblossom_[s];
            if (bs >= vertex_count_) {
                AugmentBlossom(bs, s);
            }
            mate_[s] = p;
            if (labelend_[bs] == -1) {
                break;
            }
            const int t = endpoint_[labelend_[bs]];
            const int bt = inblossom_[t];
            s = endpoint_[labelend_[bt]];
            const int j = endpoint_[labelend_[bt] ^ 1];
            if (bt >= vertex_count_) {
                AugmentBlossom(bt, j);
            }
            mate_[j] = labelend_[bt];
            p = labelend_[bt] ^ 1;
        }
    }
}

void MatchingComputer::ResetSearchState() {
    const int n = vertex_count_;
    edges_.clear();
    for (int u = 0; u < n; ++u) {
        for (int v = u + 1; v < n; ++v) {
            const Weight weight = EdgeWeight(u, v);
            if (weight > 0) {
                edges_.push_back({u, v, weight});
            }
        }
    }

    const size_t edge_count = edges_.size();
    endpoint_.assign(2 * edge_count, -1);
    neighbend_.assign(static_cast<size_t>(n), {});
    for (size_t k = 0; k < edge_count; ++k) {
        endpoint_[2 * k] = edges_[k].u;
        endpoint_[2 * k + 1] = edges_[k].v;
        neighbend_[static_cast<size_t>(edges_[k].u)].push_back(static_cast<int>(2 * k + 1));
        neighbend_[static_cast<size_t>(edges_[k].v)].push_back(static_cast<int>(2 * k));
    }

    Weight max_weight = 0;
    for (const auto& edge : edges_) {
        max_weight = std::max(max_weight, edge.weight);
    }

    const size_t two_n = static_cast<size_t>(2 * n);
    mate_.assign(static_cast<size_t>(n), -1);
    label_.assign(two_n, 0);
    labelend_.assign(two_n, -1);
    inblossom_.resize(static_cast<size_t>(n));
    for (int v = 0; v < n; ++v) {
        inblossom_[static_cast<size_t>(v)] = v;
    }
    blossomparent_.assign(two_n, -1);
    blossomchilds_.assign(two_n, {});
    blossombase_.assign(two_n, -1);
    for (int v = 0; v < n; ++v) {
        blossombase_[static_cast<size_t>(v)] = v;
    }
    blossomendps_.assign(two_n, {});
    bestedge_.assign(two_n, -1);
    blossombestedges_.assign(two_n, {});
    has_blossombestedges_.assign(two_n, false);
    unusedblossoms_.clear();
    for (int b = n; b < 2 * n; ++b) {
        unusedblossoms_.push_back(b);
    }
    dualvar_.assign(two_n, 0);
    for (int v = 0; v < n; ++v) {
        dualvar_[static_cast<size_t>(v)] = max_weight;
    }
    allowedge_.assign(edge_count, false);
    queue_.clear();
}

// One stage: grow alternating trees until an augmenting path is found or the
// duals prove that none exists. Returns true when the matching grew.
bool MatchingComputer::RunStage() {
    const int n = vertex_count_;
    std::fill(label_.begin(), label_.end(), 0);
    std::fill(bestedge_.begin(), bestedge_.end(), -1);
    for (int b = n; b < 2 * n; ++b) {
        blossombestedges_[static_cast<size_t>(b)].clear();
        has_blossombestedges_[static_cast<size_t>(b)] = false;
    }
    std::fill(allowedge_.begin(), allowedge_.end(), false);
    queue_.clear();

    for (int v = 0; v < n; ++v) {
        if (mate_[v] == -1 && label_[inblossom_[v]] == 0) {
            AssignLabel(v, 1, -1);
        }
    }

    bool augmented = false;
    while (true) {
        while (!queue_.empty() && !augmented) {
            const int v = queue_.back();
            queue_.pop_back();
            for (int p : neighbend_[v]) {
                const int k = p / 2;
                const int w = endpoint_[p];
                if (inblossom_[v] == inblossom_[w]) {
                    continue;
                }
                Weight kslack = 0;
                if (!allowedge_[k]) {
                    kslack = Slack(k);
                    if (kslack <= 0) {
                        allowedge_[k] = true;
                    }
                }
                if (allowedge_[k]) {
                    if (label_[inblossom_[w]] == 0) {
                        AssignLabel(w, 2, p ^ 1);
                    } else if (label_[inblossom_[w]] == 1) {
                        const int base = ScanBlossom(v, w);
                        if (base >= 0) {
                            AddBlossom(base, k);
                        } else {
                            AugmentMatching(k);
                            augmented = true;
                            break;
                        }
                    } else if (label_[w] == 0) {
                        label_[w] = 2;
                        labelend_[w] = p ^ 1;
                    }
                } else if (label_[inblossom_[w]] == 1) {
                    const int b = inblossom_[v];
                    if (bestedge_[b] == -1 || kslack < Slack(bestedge_[b])) {
                        bestedge_[b] = k;
                    }
                } else if (label_[w] == 0) {
                    if (bestedge_[w] == -1 || kslack < Slack(bestedge_[w])) {
                        bestedge_[w] = k;
                    }
                }
            }
        }
        if (augmented) {
            break;
        }

        // No tight edge left to explore: pick the smallest dual change.
        int deltatype = -1;
        Weight delta = 0;
        int deltaedge = -1;
        int deltablossom = -1;

        for (int v = 0; v < n; ++v) {
            if (label_[inblossom_[v]] == 0 && bestedge_[v] != -1) {
                const Weight d = Slack(bestedge_[v]);
                if (deltatype == -1 || d < delta) {
                    delta = d;
                    deltatype = 2;
                    deltaedge = bestedge_[v];
                }
            }
        }
        for (int b = 0; b < 2 * n; ++b) {
            if (blossomparent_[b] == -1 && label_[b] == 1 && bestedge_[b] != -1) {
                const Weight d = Slack(bestedge_[b]) / 2;
                if (deltatype == -1 || d < delta) {
                    delta = d;
                    deltatype = 3;
                    deltaedge = bestedge_[b];
                }
            }
        }
        for (int b = n; b < 2 * n; ++b) {
            if (blossombase_[b] >= 0 && blossomparent_[b] == -1 && label_[b] == 2 &&
                (deltatype == -1 || dualvar_[b] < delta)) {
                delta = dualvar_[b];
                deltatype = 4;
                deltablossom = b;
            }
        }
        if (deltatype == -1) {
            // Maximum cardinality reached: finish with a final dual update.
            deltatype = 1;
            delta = 0;
            bool first = true;
            for (int v = 0; v < n; ++v) {
                if (first || dualvar_[v] < delta) {
                    delta = dualvar_[v];
                    first = false;
                }
            }
            delta = std::max<Weight>(0, delta);
        }

        for (int v = 0; v < n; ++v) {
            if (label_[inblossom_[v]] == 1) {
                dualvar_[v] -= delta;
            } else if (label_[inblossom_[v]] == 2) {
                dualvar_[v] += delta;
            }
        }
        for (int b = n; b < 2 * n; ++b) {
            if (blossombase_[b] >= 0 && blossomparent_[b] == -1) {
                if (label_[b] == 1) {
                    dualvar_[b] += delta;
                } else if (label_[b] == 2) {
                    dualvar_[b] -= delta;
                }
            }
        }

        if (deltatype == 1) {
            break;
        }
        if (deltatype == 2) {
            allowedge_[deltaedge] = true;
            int i = edges_[deltaedge].u;
            const int j = edges_[deltaedge].v;
            if (label_[inblossom_[i]] == 0) {
                i = j;
            }
            queue_.push_back(i);
        } else if (deltatype == 3) {
            allowedge_[deltaedge] = true;
            queue_.push_back(edges_[deltaedge].u);
        } else if (deltatype == 4) {
            ExpandBlossom(deltablossom, false);
        }
    }

    if (!augmented) {
        return false;
    }

    for (int b = n; b < 2 * n; ++b) {
        if (blossomparent_[b] == -1 && blossombase_[b] >= 0 && label_[b] == 1 &&
            dualvar_[b] == 0) {
            ExpandBlossom(b, true);
        }
    }
    return true;
}

void MatchingComputer::ComputeMatching() {
    ResetSearchState();
    for (int stage = 0; stage < vertex_count_; ++stage) {
        if (!RunStage()) {
            break;
        }
    }

    matching_.assign(static_cast<size_t>(vertex_count_), -1);
    for (int v = 0; v < vertex_count_; ++v) {
        if (mate_[v] >= 0) {
            matching_[static_cast<size_t>(v)] = endpoint_[mate_[v]];
        }
    }

    // Free the search state; only the result is kept.
    edges_.clear();
    neighbend_.clear();
    blossomchilds_.clear();
    blossomendps_.clear();
    blossombestedges_.clear();
}

}  // namespace swisspair::core::matching
