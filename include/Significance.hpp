#pragma once

#include "DataStructures.hpp"
#include "SignatureScoring.hpp"
#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace sigproj {
namespace significance {

// Row-labelled (signature) by column-labelled (projection) results
struct SigProjResult {
    std::vector<std::string> signatureKeys;
    std::vector<std::string> projectionKeys;
    Eigen::MatrixXd consistency;
    Eigen::MatrixXd logPValues;
};

// Gaussian kernel over projection distances, zero diagonal, rows summing to 1
Eigen::MatrixXd neighborhoodWeights(const Eigen::MatrixXd& coordinates, double neighborhoodSize);

// One statistic per column of `scores` (samples x signatures):
// 1 - median |z - Wz| with z the z-scored column. Constant columns give NaN.
Eigen::VectorXd consistencyStatistics(const Eigen::MatrixXd& weights, const Eigen::MatrixXd& scores);

// Mean weighted agreement between each sample's level and its neighbours' levels
double factorConsistency(const Eigen::MatrixXd& weights, const Eigen::VectorXd& codes);

// Null statistics of background signatures, grouped by gene count
class BackgroundDistribution {
public:
    void add(int numGenes, double statistic);
    void finalize();

    // Group nearest in log size; precomputed scores (0 genes) use every group pooled
    const std::vector<double>& nullFor(int numGenes) const;

    // log10 of (1 + #{null >= statistic}) / (1 + #null)
    double logPValue(double statistic, int numGenes) const;

    bool empty() const { return pooled.empty(); }

private:
    std::map<int, std::vector<double>> bySize;
    std::vector<double> pooled;
};

double empiricalLogPValue(const std::vector<double>& sortedNull, double statistic);

// Background rows must follow sampleLabels; throws ConsistencyError otherwise
SigProjResult sigsVsProjections(const std::map<std::string, Eigen::MatrixXd>& projections,
                                const std::vector<std::string>& sampleLabels,
                                const std::map<std::string, SignatureScore>& signatureScores,
                                const scoring::ScoreMatrix& background,
                                const AnalysisParameters& params);

} // namespace significance
} // namespace sigproj
