#pragma once

#include "DataStructures.hpp"
#include "Normalization.hpp"
#include "Transforms.hpp"
#include <Eigen/Dense>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace sigproj {
namespace subsample {

constexpr int HOLDOUT_NEIGHBORS = 10;

struct SampleSplit {
    DataMatrix holdout;
    DataMatrix working;
};

// Draws `size` working samples without replacement; the rest are held out.
// No split happens when size covers every sample.
SampleSplit splitSamples(const DataMatrix& data, int size, std::mt19937& rng);

// Everything fitted on the working set that hold-out samples are transformed with
struct WorkingSetFit {
    std::optional<transforms::ProbabilityParameters> probability;
    std::optional<transforms::FalseNegativeModel> falseNegative;
    Eigen::VectorXd geneLevels;          // Detected level per expression row
    double qcCutoff = 0.0;
    const DataMatrix* inputWeights = nullptr;
};

struct MergeResult {
    std::vector<Model> models;
    QCReport holdoutQC;
};

// Nearest working samples of each hold-out, as (working column, distance) pairs
std::vector<std::vector<std::pair<int, double>>> nearestSamples(const Eigen::MatrixXd& working,
                                                                const Eigen::MatrixXd& holdout,
                                                                int k);

// Kernel-weighted mean of the neighbours' coordinates
Eigen::MatrixXd placeHoldouts(const Eigen::MatrixXd& workingCoordinates,
                              const std::vector<std::vector<std::pair<int, double>>>& neighbors);

// Majority label among the neighbours, ties to the smaller label
std::vector<int> assignHoldoutClusters(const std::vector<int>& workingLabels,
                                       const std::vector<std::vector<std::pair<int, double>>>& neighbors);

// Folds hold-out samples back into every model using the working-set fit.
// Kept signatures are re-scored, precomputed scores restored and sig-proj matrices left as they are.
MergeResult mergeSamples(const DataMatrix& holdout,
                         const std::vector<Model>& models,
                         const std::vector<Signature>& signatures,
                         const std::map<std::string, SignatureScore>& precomputed,
                         const WorkingSetFit& fit,
                         const AnalysisParameters& params);

} // namespace subsample
} // namespace sigproj
