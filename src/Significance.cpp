#include "Significance.hpp"
#include "Errors.hpp"
#include "Projections.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <random>

namespace sigproj {
namespace significance {

namespace {

constexpr int BACKGROUND_BLOCK = 512;
constexpr double MIN_SD = 1e-12;
constexpr uint32_t DEFAULT_PERMUTATION_SEED = 0;

double columnMedian(std::vector<double>& values) {
    size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    double upper = values[mid];
    if (values.size() % 2 == 1) {
        return upper;
    }
    double lower = *std::max_element(values.begin(), values.begin() + mid);
    return 0.5 * (lower + upper);
}

Eigen::MatrixXd oneHot(const Eigen::VectorXd& codes, int& numLevels) {
    numLevels = codes.size() > 0 ? static_cast<int>(codes.maxCoeff()) + 1 : 0;
    Eigen::MatrixXd indicator = Eigen::MatrixXd::Zero(codes.size(), numLevels);
    for (int i = 0; i < codes.size(); ++i) {
        indicator(i, static_cast<int>(codes(i))) = 1.0;
    }
    return indicator;
}

} // namespace

Eigen::MatrixXd neighborhoodWeights(const Eigen::MatrixXd& coordinates, double neighborhoodSize) {
    if (neighborhoodSize <= 0.0) {
        throw ConfigurationError("Neighborhood size must be positive");
    }
    Eigen::MatrixXd weights = (-projections::squaredDistances(coordinates).array() /
                               (neighborhoodSize * neighborhoodSize)).exp().matrix();
    weights.diagonal().setZero();

    for (int i = 0; i < weights.rows(); ++i) {
        double total = weights.row(i).sum();
        if (total > 0.0) {
            weights.row(i) /= total;
        }
    }
    return weights;
}

Eigen::VectorXd consistencyStatistics(const Eigen::MatrixXd& weights, const Eigen::MatrixXd& scores) {
    int n = scores.rows();
    Eigen::VectorXd statistics(scores.cols());
    if (n == 0) {
        statistics.setConstant(std::numeric_limits<double>::quiet_NaN());
        return statistics;
    }

    Eigen::MatrixXd z = scores;
    std::vector<bool> constant(scores.cols(), false);
    for (int c = 0; c < z.cols(); ++c) {
        double mean = z.col(c).mean();
        double sd = n > 1 ? std::sqrt((z.col(c).array() - mean).square().sum() / (n - 1)) : 0.0;
        if (sd < MIN_SD || !std::isfinite(sd)) {
            constant[c] = true;
            z.col(c).setZero();
        } else {
            z.col(c) = (z.col(c).array() - mean) / sd;
        }
    }

    Eigen::MatrixXd dissimilarity = (z - weights * z).cwiseAbs();
    std::vector<double> column(n);
    for (int c = 0; c < z.cols(); ++c) {
        if (constant[c]) {
            statistics(c) = std::numeric_limits<double>::quiet_NaN();
            continue;
        }
        for (int i = 0; i < n; ++i) {
            column[i] = dissimilarity(i, c);
        }
        statistics(c) = 1.0 - columnMedian(column);
    }
    return statistics;
}

double factorConsistency(const Eigen::MatrixXd& weights, const Eigen::VectorXd& codes) {
    int numLevels = 0;
    Eigen::MatrixXd indicator = oneHot(codes, numLevels);
    Eigen::MatrixXd neighborLevels = weights * indicator;

    double agreement = 0.0;
    for (int i = 0; i < codes.size(); ++i) {
        agreement += neighborLevels(i, static_cast<int>(codes(i)));
    }
    return codes.size() > 0 ? agreement / codes.size() : 0.0;
}

void BackgroundDistribution::add(int numGenes, double statistic) {
    if (!std::isfinite(statistic)) {
        return;
    }
    bySize[numGenes].push_back(statistic);
    pooled.push_back(statistic);
}

void BackgroundDistribution::finalize() {
    for (auto& entry : bySize) {
        std::sort(entry.second.begin(), entry.second.end());
    }
    std::sort(pooled.begin(), pooled.end());
}

const std::vector<double>& BackgroundDistribution::nullFor(int numGenes) const {
    if (numGenes <= 0 || bySize.empty()) {
        return pooled;
    }

    const std::vector<double>* best = &pooled;
    double bestDistance = std::numeric_limits<double>::infinity();
    for (const auto& entry : bySize) {
        double distance = std::abs(std::log(static_cast<double>(numGenes)) -
                                   std::log(static_cast<double>(std::max(entry.first, 1))));
        // Ties go to the smaller size, which comes first in the map
        if (distance < bestDistance) {
            bestDistance = distance;
            best = &entry.second;
        }
    }
    return *best;
}

double empiricalLogPValue(const std::vector<double>& sortedNull, double statistic) {
    if (!std::isfinite(statistic)) {
        return 0.0;
    }
    auto firstAtLeast = std::lower_bound(sortedNull.begin(), sortedNull.end(), statistic);
    double exceeding = static_cast<double>(sortedNull.end() - firstAtLeast);
    return std::log10((1.0 + exceeding) / (1.0 + sortedNull.size()));
}

double BackgroundDistribution::logPValue(double statistic, int numGenes) const {
    return empiricalLogPValue(nullFor(numGenes), statistic);
}

SigProjResult sigsVsProjections(const std::map<std::string, Eigen::MatrixXd>& projections,
                                const std::vector<std::string>& sampleLabels,
                                const std::map<std::string, SignatureScore>& signatureScores,
                                const scoring::ScoreMatrix& background,
                                const AnalysisParameters& params) {
    SigProjResult result;
    int n = sampleLabels.size();

    for (const auto& entry : signatureScores) {
        result.signatureKeys.push_back(entry.first);
    }
    for (const auto& entry : projections) {
        result.projectionKeys.push_back(entry.first);
    }

    int numSigs = result.signatureKeys.size();
    int numProj = result.projectionKeys.size();
    result.consistency = Eigen::MatrixXd::Zero(numSigs, numProj);
    result.logPValues = Eigen::MatrixXd::Zero(numSigs, numProj);

    // Continuous signatures side by side, factors handled one at a time
    std::vector<int> continuousRows;
    std::vector<int> factorRows;
    Eigen::MatrixXd continuous(n, 0);
    {
        std::vector<Eigen::VectorXd> columns;
        for (int r = 0; r < numSigs; ++r) {
            const SignatureScore& score = signatureScores.at(result.signatureKeys[r]);
            if (score.isFactor) {
                factorRows.push_back(r);
            } else {
                continuousRows.push_back(r);
                columns.push_back(score.valuesFor(sampleLabels));
            }
        }
        continuous.resize(n, columns.size());
        for (size_t c = 0; c < columns.size(); ++c) {
            continuous.col(c) = columns[c];
        }
    }

    if (background.size() > 0 &&
        (background.sampleLabels != sampleLabels || background.values.rows() != n)) {
        throw ConsistencyError("Background scores do not follow the model's samples");
    }

    for (int p = 0; p < numProj; ++p) {
        const Eigen::MatrixXd& coordinates = projections.at(result.projectionKeys[p]);
        if (coordinates.rows() != n) {
            throw ConsistencyError("Projection " + result.projectionKeys[p] +
                                   " does not have one row per sample");
        }
        Eigen::MatrixXd weights = neighborhoodWeights(coordinates, params.neighborhoodSize);

        BackgroundDistribution nullDistribution;
        for (int start = 0; start < background.size(); start += BACKGROUND_BLOCK) {
            int width = std::min(BACKGROUND_BLOCK, background.size() - start);
            Eigen::VectorXd stats = consistencyStatistics(weights, background.values.middleCols(start, width));
            for (int c = 0; c < width; ++c) {
                nullDistribution.add(background.numGenes[start + c], stats(c));
            }
        }
        nullDistribution.finalize();

        if (!continuousRows.empty()) {
            Eigen::VectorXd stats = consistencyStatistics(weights, continuous);
            for (size_t c = 0; c < continuousRows.size(); ++c) {
                int row = continuousRows[c];
                const SignatureScore& score = signatureScores.at(result.signatureKeys[row]);
                double stat = stats(c);
                result.consistency(row, p) = std::isfinite(stat) ? stat : 0.0;
                result.logPValues(row, p) = nullDistribution.logPValue(stat, score.numGenes);
            }
        }

        for (int row : factorRows) {
            const SignatureScore& score = signatureScores.at(result.signatureKeys[row]);
            Eigen::VectorXd codes = score.valuesFor(sampleLabels);
            double stat = factorConsistency(weights, codes);

            std::mt19937 rng(params.randomSeed.value_or(DEFAULT_PERMUTATION_SEED));
            std::vector<double> permuted;
            permuted.reserve(params.factorPermutations);
            Eigen::VectorXd shuffled = codes;
            for (int k = 0; k < params.factorPermutations; ++k) {
                std::shuffle(shuffled.data(), shuffled.data() + shuffled.size(), rng);
                permuted.push_back(factorConsistency(weights, shuffled));
            }
            std::sort(permuted.begin(), permuted.end());

            result.consistency(row, p) = stat;
            result.logPValues(row, p) = empiricalLogPValue(permuted, stat);
        }
    }
    return result;
}

} // namespace significance
} // namespace sigproj
