#pragma once

#include "DataStructures.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sigproj {
namespace clustering {

// Abstract base class for clustering methods
class ClusteringMethod {
public:
    virtual ~ClusteringMethod() = default;

    // Rows of `observations` are the items to cluster; returns one label per row
    virtual std::vector<int> performClustering(const Eigen::MatrixXd& observations) = 0;

    virtual std::string getName() const = 0;
    virtual std::string getDescription() const = 0;
};

// Single-linkage hierarchical clustering built from a minimum spanning tree
class HierarchicalClustering : public ClusteringMethod {
public:
    explicit HierarchicalClustering(int numClusters = 2);

    std::vector<int> performClustering(const Eigen::MatrixXd& observations) override;

    // Dendrogram leaf order, left subtree first
    std::vector<int> leafOrder(const Eigen::MatrixXd& observations) const;

    std::string getName() const override { return "Hierarchical_" + std::to_string(numClusters); }
    std::string getDescription() const override;

private:
    int numClusters;

    struct MergeStep {
        int left;
        int right;
        double height;
    };

    // n - 1 merges in order of increasing height; merged node i gets id n + i
    std::vector<MergeStep> buildDendrogram(const Eigen::MatrixXd& observations) const;
};

// K-means clustering implementation
class KMeansClustering : public ClusteringMethod {
public:
    explicit KMeansClustering(int k = 10, int maxIterations = 100, uint32_t seed = 0);

    std::vector<int> performClustering(const Eigen::MatrixXd& observations) override;

    std::string getName() const override { return "KMeans_" + std::to_string(k); }
    std::string getDescription() const override;

private:
    int k;
    int maxIterations;
    uint32_t seed;

    struct CentroidFit {
        Eigen::MatrixXd centroids;   // clusters x dimensions
        std::vector<int> labels;
        double inertia = 0.0;
    };

    Eigen::MatrixXd seedCentroids(const Eigen::MatrixXd& observations, int clusters) const;

    // Reassigns every point and moves the centres; false once no label changes
    bool lloydStep(const Eigen::MatrixXd& observations, CentroidFit& fit) const;
};

class ClusteringMethodFactory {
public:
    static std::unique_ptr<ClusteringMethod> createMethod(
        const std::string& methodName,
        int numClusters,
        const AnalysisParameters& params
    );

    static std::vector<std::string> availableMethods();
};

// Labels for every projection, for each configured method and cluster count below the sample count
ClusterMap defineClusters(const std::map<std::string, Eigen::MatrixXd>& projections,
                          const AnalysisParameters& params);

} // namespace clustering
} // namespace sigproj
