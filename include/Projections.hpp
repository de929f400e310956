#pragma once

#include "DataStructures.hpp"
#include <Eigen/Dense>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sigproj {
namespace projections {

// Abstract base class for 2D embeddings of samples
class ProjectionMethod {
public:
    virtual ~ProjectionMethod() = default;

    // data is features x samples; returns samples x 2
    virtual Eigen::MatrixXd project(const Eigen::MatrixXd& data) = 0;

    virtual std::string getName() const = 0;
};

class PCAProjection : public ProjectionMethod {
public:
    Eigen::MatrixXd project(const Eigen::MatrixXd& data) override;
    std::string getName() const override { return "PCA"; }
};

// Classical MDS on 1 - Pearson correlation between samples
class MDSProjection : public ProjectionMethod {
public:
    Eigen::MatrixXd project(const Eigen::MatrixXd& data) override;
    std::string getName() const override { return "MDS"; }
};

// Laplacian eigenmap of a Gaussian k-nearest-neighbour affinity graph
class SpectralEmbedding : public ProjectionMethod {
public:
    explicit SpectralEmbedding(int numNeighbors = 10);
    Eigen::MatrixXd project(const Eigen::MatrixXd& data) override;
    std::string getName() const override { return "Spectral Embedding"; }

private:
    int numNeighbors;
};

// Classical MDS on geodesic distances of a k-nearest-neighbour graph
class ISOMap : public ProjectionMethod {
public:
    explicit ISOMap(int numNeighbors = 10);
    Eigen::MatrixXd project(const Eigen::MatrixXd& data) override;
    std::string getName() const override { return "ISOMap"; }

private:
    int numNeighbors;
};

class ProjectionMethodFactory {
public:
    static std::unique_ptr<ProjectionMethod> createMethod(const std::string& methodName);

    // Lean runs drop the costlier all-pairs methods
    static std::vector<std::string> availableMethods(bool lean);
};

struct PCAResult {
    Eigen::MatrixXd scores;     // components x samples
    Eigen::MatrixXd loadings;   // features x components
    Eigen::VectorXd variance;   // explained variance per component
};

// Samples are observations, features are centred before the decomposition
PCAResult performPCA(const Eigen::MatrixXd& data, int maxComponents);

// Coordinates supplied by the caller, samples x 2
struct InputProjection {
    std::vector<std::string> sampleLabels;
    Eigen::MatrixXd coordinates;
};

using InputProjections = std::map<std::string, InputProjection>;

struct ProjectionResult {
    std::map<std::string, Eigen::MatrixXd> projections;
    DataMatrix reduced;         // PRINCIPAL_COMPONENTS representation of the input
};

// Embeds the samples of `data` with every available method and returns the PCA reduction
ProjectionResult generateProjections(const DataMatrix& data,
                                     const AnalysisParameters& params,
                                     const InputProjections* inputProjections = nullptr);

// Centres the coordinates and scales them to a maximum radius of 1
Eigen::MatrixXd normalizeProjection(const Eigen::MatrixXd& coordinates);

// Squared Euclidean distances between the rows of `points`
Eigen::MatrixXd squaredDistances(const Eigen::MatrixXd& points);

Eigen::MatrixXd classicalMDS(const Eigen::MatrixXd& distances, int dimensions = 2);

// Pearson correlation between the columns of `data`
Eigen::MatrixXd sampleCorrelation(const Eigen::MatrixXd& data);

} // namespace projections
} // namespace sigproj
