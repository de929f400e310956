#include "Projections.hpp"
#include "Errors.hpp"
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <queue>
#include <utility>

namespace sigproj {
namespace projections {

namespace {

// Indices of the k nearest other rows for every row
std::vector<std::vector<int>> nearestNeighbors(const Eigen::MatrixXd& sqDist, int k) {
    int n = sqDist.rows();
    std::vector<std::vector<int>> neighbors(n);
    for (int i = 0; i < n; ++i) {
        std::vector<std::pair<double, int>> candidates;
        candidates.reserve(n - 1);
        for (int j = 0; j < n; ++j) {
            if (j != i) {
                candidates.push_back({sqDist(i, j), j});
            }
        }
        int kk = std::min<int>(k, candidates.size());
        std::partial_sort(candidates.begin(), candidates.begin() + kk, candidates.end());
        for (int m = 0; m < kk; ++m) {
            neighbors[i].push_back(candidates[m].second);
        }
    }
    return neighbors;
}

Eigen::MatrixXd padToTwoColumns(const Eigen::MatrixXd& coordinates) {
    Eigen::MatrixXd result = Eigen::MatrixXd::Zero(coordinates.rows(), 2);
    int cols = std::min<int>(2, coordinates.cols());
    result.leftCols(cols) = coordinates.leftCols(cols);
    return result;
}

} // namespace

Eigen::MatrixXd squaredDistances(const Eigen::MatrixXd& points) {
    Eigen::VectorXd norms = points.rowwise().squaredNorm();
    Eigen::MatrixXd dist = -2.0 * points * points.transpose();
    dist.colwise() += norms;
    dist.rowwise() += norms.transpose();
    dist = dist.cwiseMax(0.0);
    dist.diagonal().setZero();
    return dist;
}

Eigen::MatrixXd sampleCorrelation(const Eigen::MatrixXd& data) {
    int numSamples = data.cols();
    Eigen::MatrixXd centered = data.rowwise() - data.colwise().mean();
    Eigen::VectorXd norms = centered.colwise().norm().transpose();

    Eigen::MatrixXd correlation = centered.transpose() * centered;
    for (int i = 0; i < numSamples; ++i) {
        for (int j = 0; j < numSamples; ++j) {
            double denom = norms(i) * norms(j);
            correlation(i, j) = denom > 0.0 ? correlation(i, j) / denom : (i == j ? 1.0 : 0.0);
        }
    }
    return correlation;
}

Eigen::MatrixXd classicalMDS(const Eigen::MatrixXd& distances, int dimensions) {
    int n = distances.rows();
    if (n == 0) {
        return Eigen::MatrixXd::Zero(0, dimensions);
    }

    // Double-centred squared distances
    Eigen::MatrixXd b = distances.array().square().matrix();
    Eigen::VectorXd rowMeans = b.rowwise().mean();
    double grandMean = rowMeans.mean();
    b.colwise() -= rowMeans;
    b.rowwise() -= rowMeans.transpose();
    b.array() += grandMean;
    b *= -0.5;

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(b);
    if (solver.info() != Eigen::Success) {
        throw ProcessingError("Eigendecomposition failed in classical MDS");
    }

    // Eigenvalues come in increasing order
    Eigen::MatrixXd coordinates = Eigen::MatrixXd::Zero(n, dimensions);
    for (int d = 0; d < dimensions && d < n; ++d) {
        int idx = n - 1 - d;
        double lambda = std::max(solver.eigenvalues()(idx), 0.0);
        coordinates.col(d) = solver.eigenvectors().col(idx) * std::sqrt(lambda);
    }
    return coordinates;
}

Eigen::MatrixXd normalizeProjection(const Eigen::MatrixXd& coordinates) {
    Eigen::MatrixXd centered = coordinates.rowwise() - coordinates.colwise().mean();
    double radius = centered.rows() > 0 ? centered.rowwise().norm().maxCoeff() : 0.0;
    if (radius > 0.0) {
        centered /= radius;
    }
    return centered;
}

PCAResult performPCA(const Eigen::MatrixXd& data, int maxComponents) {
    int numFeatures = data.rows();
    int numSamples = data.cols();
    PCAResult result;
    if (numFeatures == 0 || numSamples == 0) {
        throw ProcessingError("Cannot run PCA on an empty matrix");
    }

    // Samples x features, each feature centred
    Eigen::MatrixXd centered = data.transpose();
    centered.rowwise() -= centered.colwise().mean();

    Eigen::BDCSVD<Eigen::MatrixXd> svd(centered, Eigen::ComputeThinU | Eigen::ComputeThinV);
    int available = svd.singularValues().size();
    int components = std::max(1, std::min(maxComponents, available));

    result.loadings = svd.matrixV().leftCols(components);
    Eigen::MatrixXd scores = svd.matrixU().leftCols(components) *
                             svd.singularValues().head(components).asDiagonal();

    // Fix the sign so that each loading's largest entry is positive
    for (int c = 0; c < components; ++c) {
        Eigen::Index maxRow;
        result.loadings.col(c).cwiseAbs().maxCoeff(&maxRow);
        if (result.loadings(maxRow, c) < 0.0) {
            result.loadings.col(c) *= -1.0;
            scores.col(c) *= -1.0;
        }
    }

    result.scores = scores.transpose();
    result.variance = svd.singularValues().head(components).array().square() /
                      std::max(numSamples - 1, 1);
    return result;
}

Eigen::MatrixXd PCAProjection::project(const Eigen::MatrixXd& data) {
    PCAResult pca = performPCA(data, 2);
    return padToTwoColumns(pca.scores.transpose());
}

Eigen::MatrixXd MDSProjection::project(const Eigen::MatrixXd& data) {
    Eigen::MatrixXd distance = (1.0 - sampleCorrelation(data).array()).cwiseMax(0.0).matrix();
    return classicalMDS(distance, 2);
}

SpectralEmbedding::SpectralEmbedding(int numNeighbors)
    : numNeighbors(numNeighbors) {}

Eigen::MatrixXd SpectralEmbedding::project(const Eigen::MatrixXd& data) {
    int n = data.cols();
    if (n < 3) {
        return Eigen::MatrixXd::Zero(n, 2);
    }

    Eigen::MatrixXd sqDist = squaredDistances(data.transpose());
    auto neighbors = nearestNeighbors(sqDist, std::min(numNeighbors, n - 1));

    // Local bandwidth: distance to the furthest of the k neighbours
    Eigen::VectorXd sigma(n);
    for (int i = 0; i < n; ++i) {
        sigma(i) = std::max(std::sqrt(sqDist(i, neighbors[i].back())), 1e-12);
    }

    Eigen::MatrixXd affinity = Eigen::MatrixXd::Zero(n, n);
    for (int i = 0; i < n; ++i) {
        for (int j : neighbors[i]) {
            double w = std::exp(-sqDist(i, j) / (sigma(i) * sigma(j)));
            affinity(i, j) = std::max(affinity(i, j), w);
            affinity(j, i) = affinity(i, j);
        }
    }

    Eigen::VectorXd invSqrtDegree = affinity.rowwise().sum().cwiseMax(1e-12).cwiseSqrt().cwiseInverse();
    Eigen::MatrixXd normalized = invSqrtDegree.asDiagonal() * affinity * invSqrtDegree.asDiagonal();

    // Largest eigenvectors of D^-1/2 W D^-1/2 are the smallest of the normalized Laplacian
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(normalized);
    if (solver.info() != Eigen::Success) {
        throw ProcessingError("Eigendecomposition failed in spectral embedding");
    }

    Eigen::MatrixXd embedding(n, 2);
    embedding.col(0) = invSqrtDegree.cwiseProduct(solver.eigenvectors().col(n - 2));
    embedding.col(1) = invSqrtDegree.cwiseProduct(solver.eigenvectors().col(n - 3));
    return embedding;
}

ISOMap::ISOMap(int numNeighbors)
    : numNeighbors(numNeighbors) {}

Eigen::MatrixXd ISOMap::project(const Eigen::MatrixXd& data) {
    int n = data.cols();
    if (n < 2) {
        return Eigen::MatrixXd::Zero(n, 2);
    }

    Eigen::MatrixXd sqDist = squaredDistances(data.transpose());
    auto neighbors = nearestNeighbors(sqDist, std::min(numNeighbors, n - 1));

    std::vector<std::vector<std::pair<int, double>>> graph(n);
    for (int i = 0; i < n; ++i) {
        for (int j : neighbors[i]) {
            double d = std::sqrt(sqDist(i, j));
            graph[i].push_back({j, d});
            graph[j].push_back({i, d});
        }
    }

    const double inf = std::numeric_limits<double>::infinity();
    Eigen::MatrixXd geodesic = Eigen::MatrixXd::Constant(n, n, inf);

    #pragma omp parallel for schedule(dynamic)
    for (int source = 0; source < n; ++source) {
        using Item = std::pair<double, int>;
        std::priority_queue<Item, std::vector<Item>, std::greater<Item>> queue;
        std::vector<double> dist(n, inf);
        dist[source] = 0.0;
        queue.push({0.0, source});
        while (!queue.empty()) {
            double d = queue.top().first;
            int node = queue.top().second;
            queue.pop();
            if (d > dist[node]) {
                continue;
            }
            for (const auto& edge : graph[node]) {
                double candidate = d + edge.second;
                if (candidate < dist[edge.first]) {
                    dist[edge.first] = candidate;
                    queue.push({candidate, edge.first});
                }
            }
        }
        for (int j = 0; j < n; ++j) {
            geodesic(source, j) = dist[j];
        }
    }

    // Disconnected components are placed at twice the largest finite distance
    double maxFinite = 0.0;
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            if (std::isfinite(geodesic(i, j))) {
                maxFinite = std::max(maxFinite, geodesic(i, j));
            }
        }
    }
    geodesic = geodesic.unaryExpr([maxFinite](double v) { return std::isfinite(v) ? v : 2.0 * maxFinite; });

    return classicalMDS(geodesic, 2);
}

std::unique_ptr<ProjectionMethod> ProjectionMethodFactory::createMethod(const std::string& methodName) {
    if (methodName == "PCA") {
        return std::make_unique<PCAProjection>();
    } else if (methodName == "MDS") {
        return std::make_unique<MDSProjection>();
    } else if (methodName == "Spectral Embedding") {
        return std::make_unique<SpectralEmbedding>();
    } else if (methodName == "ISOMap") {
        return std::make_unique<ISOMap>();
    }
    throw ConfigurationError("Unknown projection method: " + methodName);
}

std::vector<std::string> ProjectionMethodFactory::availableMethods(bool lean) {
    if (lean) {
        return {"PCA", "Spectral Embedding"};
    }
    return {"PCA", "MDS", "Spectral Embedding", "ISOMap"};
}

ProjectionResult generateProjections(const DataMatrix& data,
                                     const AnalysisParameters& params,
                                     const InputProjections* inputProjections) {
    if (data.numGenes() == 0 || data.numSamples() == 0) {
        throw ProcessingError("Cannot project an empty matrix");
    }

    ProjectionResult result;
    for (const auto& methodName : ProjectionMethodFactory::availableMethods(params.lean)) {
        auto method = ProjectionMethodFactory::createMethod(methodName);
        Eigen::MatrixXd coordinates = method->project(data.values);
        if (!coordinates.allFinite()) {
            throw ProcessingError("Projection " + methodName + " produced non-finite coordinates");
        }
        result.projections[method->getName()] = normalizeProjection(coordinates);
    }

    if (inputProjections) {
        for (const auto& input : *inputProjections) {
            if (input.second.coordinates.cols() != 2 ||
                input.second.coordinates.rows() != static_cast<Eigen::Index>(input.second.sampleLabels.size())) {
                throw ConsistencyError("Input projection " + input.first + " must be samples x 2");
            }
            Eigen::MatrixXd aligned(data.numSamples(), 2);
            for (int s = 0; s < data.numSamples(); ++s) {
                auto it = std::find(input.second.sampleLabels.begin(), input.second.sampleLabels.end(),
                                    data.sampleLabels[s]);
                if (it == input.second.sampleLabels.end()) {
                    throw ConsistencyError("Input projection " + input.first +
                                           " has no coordinates for sample " + data.sampleLabels[s]);
                }
                aligned.row(s) = input.second.coordinates.row(it - input.second.sampleLabels.begin());
            }
            result.projections[input.first] = normalizeProjection(aligned);
        }
    }

    PCAResult pca = performPCA(data.values, params.pcaComponents);
    std::vector<std::string> componentNames;
    for (int c = 0; c < pca.scores.rows(); ++c) {
        componentNames.push_back("PC" + std::to_string(c + 1));
    }
    result.reduced = DataMatrix(pca.scores, componentNames, data.sampleLabels, DataKind::PRINCIPAL_COMPONENTS);
    result.reduced.loadings = pca.loadings;
    return result;
}

} // namespace projections
} // namespace sigproj
