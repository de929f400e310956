#pragma once

#include "DataMatrix.hpp"
#include "DataStructures.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace sigproj {
namespace transforms {

// Per-gene parameters of the exponential (non-detected) / normal (detected) mixture
struct ProbabilityParameters {
    std::vector<std::string> geneNames;
    Eigen::VectorXd muHigh;
    Eigen::VectorXd muLow;
    Eigen::VectorXd sigmaHigh;
    Eigen::VectorXd mixtureWeight;
};

struct ProbabilityFit {
    Eigen::MatrixXd probabilities;   // Posterior of the detected component, genes x samples
    ProbabilityParameters parameters;
};

ProbabilityFit probabilityOfExpression(const DataMatrix& data,
                                       int maxIterations = 100,
                                       double tolerance = 1e-6);

// Parameters averaged over the genes that were ever detected
MixtureSummary summarizeMixture(const ProbabilityParameters& parameters);

// Posterior probabilities for new samples under previously fitted parameters
Eigen::MatrixXd applyProbabilityModel(const DataMatrix& data,
                                      const ProbabilityParameters& parameters);

// Mean of the non-zero values of each gene, 0 for genes never detected
Eigen::VectorXd detectedGeneLevels(const Eigen::MatrixXd& data);

// Logistic curve per sample: P(undetected) as a function of a gene's detected level
class FalseNegativeModel {
public:
    // Falls back to all genes (with a warning) when no housekeeping gene is usable
    static FalseNegativeModel fit(const DataMatrix& original,
                                  const std::vector<std::string>& housekeepingGenes,
                                  std::vector<std::string>* warnings = nullptr);

    // Fits curves for other samples, reusing this model's genes and gene levels
    FalseNegativeModel fitSamples(const DataMatrix& data) const;

    double probability(double geneLevel, int sample) const;

    // Mean predicted false-negative rate over the curve genes, per sample
    Eigen::VectorXd qualityScores() const;

    const Eigen::MatrixXd& parameters() const { return params; }
    const std::vector<std::string>& sampleLabels() const { return samples; }
    const std::vector<std::string>& curveGenes() const { return genes; }

private:
    Eigen::MatrixXd params;          // 2 x samples: intercept, slope
    std::vector<std::string> samples;
    std::vector<std::string> genes;
    Eigen::VectorXd geneLevels;

    static Eigen::Vector2d fitLogistic(const Eigen::VectorXd& levels,
                                       const Eigen::VectorXd& undetected);
};

// Detected entries weigh 1, zeros weigh 1 - P(false negative).
// Gene levels come from the data unless reference levels (one per row) are given.
Eigen::MatrixXd computeWeights(const FalseNegativeModel& model,
                               const DataMatrix& data,
                               const Eigen::VectorXd* referenceLevels = nullptr);

// Externally supplied weights reordered to the matrix's genes and samples
Eigen::MatrixXd alignWeights(const DataMatrix& externalWeights, const DataMatrix& data);

// Shrinks probabilities of unreliable zeros toward the gene's detected mean probability
Eigen::MatrixXd adjustProbabilities(const Eigen::MatrixXd& probabilities,
                                    const Eigen::MatrixXd& weights,
                                    const Eigen::MatrixXd& data);

struct QualityCheck {
    Eigen::VectorXd scores;
    std::vector<bool> passes;
    double cutoff = 0.0;
};

// Samples pass when their score is at most median + nmads * MAD
QualityCheck qualityCheck(const FalseNegativeModel& model, double nmads);

std::vector<bool> applyQualityCutoff(const Eigen::VectorXd& scores, double cutoff);

} // namespace transforms
} // namespace sigproj
