#include "ClusteringMethods.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <limits>
#include <random>
#include <cmath>
#include <numeric>

namespace sigproj {
namespace clustering {

namespace {

constexpr uint32_t DEFAULT_CLUSTER_SEED = 0;

int findRoot(std::vector<int>& parent, int i) {
    while (parent[i] != i) {
        parent[i] = parent[parent[i]];
        i = parent[i];
    }
    return i;
}

// Relabels so that clusters are numbered in order of first appearance
std::vector<int> compactLabels(const std::vector<int>& labels) {
    std::map<int, int> mapping;
    std::vector<int> compact(labels.size());
    for (size_t i = 0; i < labels.size(); ++i) {
        auto it = mapping.find(labels[i]);
        if (it == mapping.end()) {
            it = mapping.emplace(labels[i], static_cast<int>(mapping.size())).first;
        }
        compact[i] = it->second;
    }
    return compact;
}

} // namespace

// Hierarchical Clustering Implementation
HierarchicalClustering::HierarchicalClustering(int numClusters)
    : numClusters(numClusters) {
    if (numClusters < 1) {
        throw ConfigurationError("Hierarchical clustering needs at least one cluster");
    }
}

std::vector<HierarchicalClustering::MergeStep> HierarchicalClustering::buildDendrogram(
    const Eigen::MatrixXd& observations) const {

    int n = observations.rows();
    if (n < 2) {
        return {};
    }

    // Prim's algorithm; distances are computed on the fly to keep memory linear
    struct Edge {
        int a;
        int b;
        double weight;
    };
    std::vector<Edge> tree;
    tree.reserve(n - 1);

    std::vector<bool> inTree(n, false);
    std::vector<double> bestDistance(n, std::numeric_limits<double>::infinity());
    std::vector<int> bestSource(n, 0);

    int current = 0;
    inTree[0] = true;
    for (int added = 1; added < n; ++added) {
        int next = -1;
        double nextDistance = std::numeric_limits<double>::infinity();
        for (int j = 0; j < n; ++j) {
            if (inTree[j]) {
                continue;
            }
            double dist = (observations.row(j) - observations.row(current)).norm();
            if (dist < bestDistance[j]) {
                bestDistance[j] = dist;
                bestSource[j] = current;
            }
            if (next < 0 || bestDistance[j] < nextDistance) {
                nextDistance = bestDistance[j];
                next = j;
            }
        }
        inTree[next] = true;
        tree.push_back({bestSource[next], next, nextDistance});
        current = next;
    }

    std::stable_sort(tree.begin(), tree.end(),
                     [](const Edge& x, const Edge& y) { return x.weight < y.weight; });

    // Single linkage merges follow the sorted tree edges
    std::vector<int> parent(n);
    std::iota(parent.begin(), parent.end(), 0);
    std::vector<int> nodeOf(n);
    std::iota(nodeOf.begin(), nodeOf.end(), 0);

    std::vector<MergeStep> merges;
    merges.reserve(n - 1);
    for (const auto& edge : tree) {
        int ra = findRoot(parent, edge.a);
        int rb = findRoot(parent, edge.b);
        int left = std::min(nodeOf[ra], nodeOf[rb]);
        int right = std::max(nodeOf[ra], nodeOf[rb]);
        merges.push_back({left, right, edge.weight});

        parent[rb] = ra;
        nodeOf[ra] = n + static_cast<int>(merges.size()) - 1;
    }
    return merges;
}

std::vector<int> HierarchicalClustering::performClustering(const Eigen::MatrixXd& observations) {
    int n = observations.rows();
    std::vector<MergeStep> merges = buildDendrogram(observations);

    // Stop merging once numClusters groups remain
    int mergesToApply = std::max(0, n - std::min(numClusters, n));
    std::vector<std::vector<int>> members(n + merges.size());
    for (int i = 0; i < n; ++i) {
        members[i] = {i};
    }
    std::vector<int> labels(n);
    std::iota(labels.begin(), labels.end(), 0);

    for (int m = 0; m < mergesToApply && m < static_cast<int>(merges.size()); ++m) {
        int node = n + m;
        members[node] = members[merges[m].left];
        members[node].insert(members[node].end(),
                             members[merges[m].right].begin(), members[merges[m].right].end());
        for (int item : members[node]) {
            labels[item] = node;
        }
    }
    return compactLabels(labels);
}

std::vector<int> HierarchicalClustering::leafOrder(const Eigen::MatrixXd& observations) const {
    int n = observations.rows();
    if (n == 0) {
        return {};
    }
    if (n == 1) {
        return {0};
    }

    std::vector<MergeStep> merges = buildDendrogram(observations);
    std::vector<int> order;
    order.reserve(n);

    std::vector<int> stack = {n + static_cast<int>(merges.size()) - 1};
    while (!stack.empty()) {
        int node = stack.back();
        stack.pop_back();
        if (node < n) {
            order.push_back(node);
        } else {
            const MergeStep& step = merges[node - n];
            stack.push_back(step.right);
            stack.push_back(step.left);
        }
    }
    return order;
}

std::string HierarchicalClustering::getDescription() const {
    return "Hierarchical clustering with single linkage, cut at " +
           std::to_string(numClusters) + " clusters";
}

// K-means Clustering Implementation
KMeansClustering::KMeansClustering(int k, int maxIterations, uint32_t seed)
    : k(k), maxIterations(maxIterations), seed(seed) {
    if (k < 1) {
        throw ConfigurationError("K-means needs at least one cluster");
    }
}

std::vector<int> KMeansClustering::performClustering(const Eigen::MatrixXd& observations) {
    int n = observations.rows();
    if (n == 0) {
        return {};
    }

    CentroidFit fit;
    fit.centroids = seedCentroids(observations, std::min(k, n));
    fit.labels.assign(n, -1);

    for (int iter = 0; iter < maxIterations; ++iter) {
        if (!lloydStep(observations, fit)) {
            break;
        }
    }
    return compactLabels(fit.labels);
}

Eigen::MatrixXd KMeansClustering::seedCentroids(const Eigen::MatrixXd& observations, int clusters) const {
    std::mt19937 gen(seed);
    int n = observations.rows();

    // k-means++: each new centre is drawn proportionally to the squared distance to the nearest chosen one
    std::vector<int> chosen = {std::uniform_int_distribution<int>(0, n - 1)(gen)};
    Eigen::VectorXd nearest = Eigen::VectorXd::Constant(n, std::numeric_limits<double>::infinity());

    while (static_cast<int>(chosen.size()) < clusters) {
        Eigen::VectorXd toNewest =
            (observations.rowwise() - observations.row(chosen.back())).rowwise().squaredNorm();
        nearest = nearest.cwiseMin(toNewest);

        if (nearest.sum() <= 0.0) {
            // Remaining points all sit on a centre already
            chosen.push_back(static_cast<int>(chosen.size()) % n);
            continue;
        }
        std::discrete_distribution<int> draw(nearest.data(), nearest.data() + n);
        chosen.push_back(draw(gen));
    }

    Eigen::MatrixXd centroids(clusters, observations.cols());
    for (int c = 0; c < clusters; ++c) {
        centroids.row(c) = observations.row(chosen[c]);
    }
    return centroids;
}

bool KMeansClustering::lloydStep(const Eigen::MatrixXd& observations, CentroidFit& fit) const {
    int n = observations.rows();
    int clusters = fit.centroids.rows();

    // |x - c|^2 for every point and centre
    Eigen::MatrixXd squared = -2.0 * observations * fit.centroids.transpose();
    squared.colwise() += observations.rowwise().squaredNorm();
    squared.rowwise() += fit.centroids.rowwise().squaredNorm().transpose();

    bool moved = false;
    fit.inertia = 0.0;
    for (int i = 0; i < n; ++i) {
        Eigen::Index best;
        fit.inertia += std::max(squared.row(i).minCoeff(&best), 0.0);
        if (fit.labels[i] != best) {
            fit.labels[i] = static_cast<int>(best);
            moved = true;
        }
    }
    if (!moved) {
        return false;
    }

    // A centre left without members stays where it was
    Eigen::MatrixXd sums = Eigen::MatrixXd::Zero(clusters, observations.cols());
    Eigen::VectorXd members = Eigen::VectorXd::Zero(clusters);
    for (int i = 0; i < n; ++i) {
        sums.row(fit.labels[i]) += observations.row(i);
        members(fit.labels[i]) += 1.0;
    }
    for (int c = 0; c < clusters; ++c) {
        if (members(c) > 0.0) {
            fit.centroids.row(c) = sums.row(c) / members(c);
        }
    }
    return true;
}

std::string KMeansClustering::getDescription() const {
    return "K-means clustering with k=" + std::to_string(k) +
           " and max_iterations=" + std::to_string(maxIterations);
}

// Factory Implementation
std::unique_ptr<ClusteringMethod> ClusteringMethodFactory::createMethod(
    const std::string& methodName,
    int numClusters,
    const AnalysisParameters& params) {

    if (methodName == "hierarchical") {
        return std::make_unique<HierarchicalClustering>(numClusters);
    } else if (methodName == "kmeans") {
        return std::make_unique<KMeansClustering>(
            numClusters, 100, params.randomSeed.value_or(DEFAULT_CLUSTER_SEED));
    } else {
        throw ConfigurationError("Unknown clustering method: " + methodName);
    }
}

std::vector<std::string> ClusteringMethodFactory::availableMethods() {
    return {"hierarchical", "kmeans"};
}

ClusterMap defineClusters(const std::map<std::string, Eigen::MatrixXd>& projections,
                          const AnalysisParameters& params) {
    ClusterMap clusters;
    for (const auto& projection : projections) {
        auto& byMethod = clusters[projection.first];
        int n = projection.second.rows();
        for (const auto& methodName : params.clusterMethods) {
            for (int count : params.clusterCounts) {
                if (count < 1 || count >= n) {
                    continue;
                }
                auto method = ClusteringMethodFactory::createMethod(methodName, count, params);
                byMethod[method->getName()] = method->performClustering(projection.second);
            }
        }
    }
    return clusters;
}

} // namespace clustering
} // namespace sigproj
