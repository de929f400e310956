#include "SubSample.hpp"
#include "Errors.hpp"
#include "SignatureScoring.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace sigproj {
namespace subsample {

namespace {

using Neighborhoods = std::vector<std::vector<std::pair<int, double>>>;

Eigen::MatrixXd geneRows(const DataMatrix& data, const std::vector<std::string>& genes) {
    Eigen::MatrixXd rows(genes.size(), data.numSamples());
    for (size_t i = 0; i < genes.size(); ++i) {
        int row = data.geneIndex(genes[i]);
        if (row < 0) {
            throw ConsistencyError("Projection gene missing from model data: " + genes[i]);
        }
        rows.row(i) = data.values.row(row);
    }
    return rows;
}

// Hold-out matrix of one model kind, built with working-set parameters
DataMatrix holdoutModelData(const Model& model,
                            const DataMatrix& expression,
                            const WorkingSetFit& fit) {
    DataMatrix result;
    switch (model.kind) {
        case ModelKind::EXPRESSION:
            result = expression;
            break;
        case ModelKind::PROBABILITY: {
            if (!fit.probability) {
                throw ProcessingError("Probability model has no fitted mixture parameters");
            }
            Eigen::MatrixXd probabilities = transforms::applyProbabilityModel(expression, *fit.probability);
            if (expression.hasWeights()) {
                probabilities = transforms::adjustProbabilities(probabilities, expression.weights, expression.values);
            }
            result = DataMatrix(probabilities, expression.geneNames, expression.sampleLabels, DataKind::PROBABILITY);
            result.weights = expression.weights;
            break;
        }
        default:
            throw ProcessingError("Unknown model kind");
    }

    if (!model.data.hasWeights()) {
        result.weights.resize(0, 0);
    }
    result.filters = model.data.filters;
    return result;
}

} // namespace

SampleSplit splitSamples(const DataMatrix& data, int size, std::mt19937& rng) {
    if (size < 1) {
        throw ConfigurationError("Sub-sample size must be positive");
    }

    int n = data.numSamples();
    if (size >= n) {
        return {data.subsetSamples(std::vector<std::string>{}), data};
    }

    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);
    for (int k = 0; k < size; ++k) {
        std::uniform_int_distribution<int> pick(k, n - 1);
        std::swap(order[k], order[pick(rng)]);
    }

    // Both halves keep the input's sample order
    std::vector<bool> working(n, false);
    for (int k = 0; k < size; ++k) {
        working[order[k]] = true;
    }
    std::vector<bool> holdout(n);
    for (int j = 0; j < n; ++j) {
        holdout[j] = !working[j];
    }
    return {data.subsetSamples(holdout), data.subsetSamples(working)};
}

std::vector<std::vector<std::pair<int, double>>> nearestSamples(const Eigen::MatrixXd& working,
                                                                const Eigen::MatrixXd& holdout,
                                                                int k) {
    if (working.rows() != holdout.rows()) {
        throw ConsistencyError("Working and hold-out samples live in different gene spaces");
    }
    int numWorking = working.cols();
    k = std::min(k, numWorking);
    if (k < 1) {
        throw ProcessingError("No working samples to place hold-out samples against");
    }

    Eigen::VectorXd workingNorms = working.colwise().squaredNorm().transpose();
    Neighborhoods neighbors(holdout.cols());

    #pragma omp parallel for
    for (int h = 0; h < holdout.cols(); ++h) {
        Eigen::VectorXd squared = workingNorms - 2.0 * working.transpose() * holdout.col(h);
        squared.array() += holdout.col(h).squaredNorm();

        std::vector<std::pair<double, int>> candidates(numWorking);
        for (int w = 0; w < numWorking; ++w) {
            candidates[w] = {std::max(squared(w), 0.0), w};
        }
        std::partial_sort(candidates.begin(), candidates.begin() + k, candidates.end());

        for (int i = 0; i < k; ++i) {
            neighbors[h].push_back({candidates[i].second, std::sqrt(candidates[i].first)});
        }
    }
    return neighbors;
}

Eigen::MatrixXd placeHoldouts(const Eigen::MatrixXd& workingCoordinates,
                              const std::vector<std::vector<std::pair<int, double>>>& neighbors) {
    Eigen::MatrixXd placed(neighbors.size(), workingCoordinates.cols());
    for (size_t h = 0; h < neighbors.size(); ++h) {
        double bandwidth = 0.0;
        for (const auto& neighbor : neighbors[h]) {
            bandwidth = std::max(bandwidth, neighbor.second);
        }

        Eigen::RowVectorXd position = Eigen::RowVectorXd::Zero(workingCoordinates.cols());
        double total = 0.0;
        for (const auto& neighbor : neighbors[h]) {
            double weight = 1.0;
            if (bandwidth > 0.0) {
                double scaled = neighbor.second / bandwidth;
                weight = std::exp(-scaled * scaled);
            }
            position += weight * workingCoordinates.row(neighbor.first);
            total += weight;
        }
        placed.row(h) = total > 0.0 ? Eigen::RowVectorXd(position / total) : position;
    }
    return placed;
}

std::vector<int> assignHoldoutClusters(const std::vector<int>& workingLabels,
                                       const std::vector<std::vector<std::pair<int, double>>>& neighbors) {
    std::vector<int> labels;
    labels.reserve(neighbors.size());
    for (const auto& neighborhood : neighbors) {
        std::map<int, int> votes;
        for (const auto& neighbor : neighborhood) {
            ++votes[workingLabels.at(neighbor.first)];
        }
        int best = -1;
        int bestVotes = 0;
        for (const auto& vote : votes) {
            if (vote.second > bestVotes) {
                best = vote.first;
                bestVotes = vote.second;
            }
        }
        labels.push_back(best);
    }
    return labels;
}

MergeResult mergeSamples(const DataMatrix& holdout,
                         const std::vector<Model>& models,
                         const std::vector<Signature>& signatures,
                         const std::map<std::string, SignatureScore>& precomputed,
                         const WorkingSetFit& fit,
                         const AnalysisParameters& params) {
    MergeResult result;
    result.models = models;
    if (holdout.numSamples() == 0) {
        return result;
    }

    // Quality of the hold-outs against the working-set cutoff
    Eigen::VectorXd quality = Eigen::VectorXd::Zero(holdout.numSamples());
    std::vector<bool> passes(holdout.numSamples(), true);
    if (fit.falseNegative) {
        quality = fit.falseNegative->fitSamples(holdout).qualityScores();
        passes = transforms::applyQualityCutoff(quality, fit.qcCutoff);
    }

    std::vector<bool> keep(holdout.numSamples(), true);
    if (params.qcFilter) {
        keep = passes;
    }
    for (int s = 0; s < holdout.numSamples(); ++s) {
        if (keep[s]) {
            result.holdoutQC.sampleLabels.push_back(holdout.sampleLabels[s]);
            result.holdoutQC.scores.push_back(quality(s));
            result.holdoutQC.passes.push_back(passes[s]);
        }
    }

    DataMatrix expression = holdout.subsetSamples(keep);
    if (expression.numSamples() == 0) {
        return result;
    }
    Eigen::VectorXd keptQuality(expression.numSamples());
    for (int s = 0; s < expression.numSamples(); ++s) {
        keptQuality(s) = result.holdoutQC.scores[s];
    }

    if (fit.inputWeights) {
        expression.weights = transforms::alignWeights(*fit.inputWeights, expression);
    } else if (fit.falseNegative) {
        transforms::FalseNegativeModel holdoutCurves = fit.falseNegative->fitSamples(expression);
        expression.weights = transforms::computeWeights(holdoutCurves, expression, &fit.geneLevels);
    }

    std::map<std::string, const Signature*> signatureLookup;
    for (const auto& signature : signatures) {
        signatureLookup[signature.name()] = &signature;
    }

    BoolMatrix zeros = expression.zeroLocations();
    Eigen::VectorXd zeroFraction = scoring::zeroProportion(expression.values);
    const std::vector<std::string>& labels = expression.sampleLabels;

    for (auto& model : result.models) {
        if (model.data.geneNames != expression.geneNames) {
            throw ConsistencyError("Hold-out genes differ from model " + model.name);
        }
        DataMatrix data = holdoutModelData(model, expression, fit);

        // Re-score with the working set's normalization statistics
        scoring::KindScoringConfig config = scoring::scoringConfigFor(model.kind, params);
        DataMatrix sigData = data;
        sigData.values = normalization::normalize(data.values, config.normalization,
                                                  normalization::computeRowStatistics(model.data.values));

        for (auto& entry : model.signatureScores) {
            SignatureScore& score = entry.second;
            Eigen::VectorXd extra;
            if (score.isPrecomputed) {
                if (entry.first == QUALITY_SCORE_NAME) {
                    extra = keptQuality;
                } else if (entry.first == ZERO_PROPORTION_NAME) {
                    extra = zeroFraction;
                } else {
                    auto it = precomputed.find(entry.first);
                    if (it == precomputed.end()) {
                        throw ConsistencyError("No precomputed values for " + entry.first);
                    }
                    extra = it->second.valuesFor(labels);
                }
            } else {
                auto it = signatureLookup.find(entry.first);
                if (it == signatureLookup.end()) {
                    throw ConsistencyError("Scored signature " + entry.first + " is not in the signature set");
                }
                ScoreOutcome outcome = scoring::scoreSignature(sigData, *it->second, zeros,
                                                               params.minSignatureGenes, config.method);
                const auto* scored = std::get_if<SignatureScore>(&outcome);
                if (!scored) {
                    throw ConsistencyError("Signature " + entry.first + " lost coverage on hold-out samples");
                }
                extra = scored->values;
            }
            score = score.extended(labels, extra);
        }

        for (auto& projData : model.projectionData) {
            Neighborhoods neighbors = nearestSamples(geneRows(model.data, projData.genes),
                                                     geneRows(data, projData.genes),
                                                     HOLDOUT_NEIGHBORS);

            for (auto& projection : projData.projections) {
                Eigen::MatrixXd placed = placeHoldouts(projection.second, neighbors);
                Eigen::MatrixXd merged(projection.second.rows() + placed.rows(), projection.second.cols());
                merged << projection.second, placed;
                projection.second = merged;
            }

            for (auto& byProjection : projData.clusters) {
                for (auto& byMethod : byProjection.second) {
                    std::vector<int> extraLabels = assignHoldoutClusters(byMethod.second, neighbors);
                    byMethod.second.insert(byMethod.second.end(), extraLabels.begin(), extraLabels.end());
                }
            }
        }

        model.data = model.data.concatenateSamples(data);
        model.sampleLabels = model.data.sampleLabels;
    }
    return result;
}

} // namespace subsample
} // namespace sigproj
