#include "SignatureScoring.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <exception>

namespace sigproj {
namespace scoring {

namespace {

constexpr int BATCH_CHUNK = 256;

struct SignatureRows {
    std::vector<int> rows;
    std::vector<double> signs;
};

SignatureRows overlappingRows(const DataMatrix& data, const Signature& signature) {
    SignatureRows overlap;
    for (const auto& entry : signature.genes()) {
        int row = data.geneIndex(entry.first);
        if (row >= 0) {
            overlap.rows.push_back(row);
            overlap.signs.push_back(signature.signFor(entry.first));
        }
    }
    return overlap;
}

Eigen::VectorXd naiveScores(const Eigen::MatrixXd& data, const SignatureRows& overlap) {
    Eigen::VectorXd scores = Eigen::VectorXd::Zero(data.cols());
    for (size_t i = 0; i < overlap.rows.size(); ++i) {
        scores += overlap.signs[i] * data.row(overlap.rows[i]).transpose();
    }
    return scores / static_cast<double>(overlap.rows.size());
}

Eigen::VectorXd weightedScores(const DataMatrix& data, const SignatureRows& overlap) {
    if (!data.hasWeights()) {
        return naiveScores(data.values, overlap);
    }

    Eigen::VectorXd numerator = Eigen::VectorXd::Zero(data.numSamples());
    Eigen::VectorXd denominator = Eigen::VectorXd::Zero(data.numSamples());
    for (size_t i = 0; i < overlap.rows.size(); ++i) {
        int row = overlap.rows[i];
        numerator += overlap.signs[i] *
                     (data.weights.row(row).array() * data.values.row(row).array()).matrix().transpose();
        denominator += data.weights.row(row).transpose();
    }

    Eigen::VectorXd scores(data.numSamples());
    for (int s = 0; s < data.numSamples(); ++s) {
        scores(s) = denominator(s) > 0.0 ? numerator(s) / denominator(s) : 0.0;
    }
    return scores;
}

Eigen::VectorXd imputedScores(const DataMatrix& data,
                              const SignatureRows& overlap,
                              const BoolMatrix& zeroLocations) {
    Eigen::MatrixXd imputed(overlap.rows.size(), data.numSamples());
    for (size_t i = 0; i < overlap.rows.size(); ++i) {
        int row = overlap.rows[i];

        int detected = 0;
        double sum = 0.0;
        for (int s = 0; s < data.numSamples(); ++s) {
            if (!zeroLocations(row, s)) {
                ++detected;
                sum += data.values(row, s);
            }
        }
        double detectedMean = detected > 0 ? sum / detected : 0.0;

        for (int s = 0; s < data.numSamples(); ++s) {
            double x = data.values(row, s);
            if (zeroLocations(row, s)) {
                double w = data.hasWeights() ? data.weights(row, s) : 0.0;
                x = w * x + (1.0 - w) * detectedMean;
            }
            imputed(i, s) = overlap.signs[i] * x;
        }
    }
    return imputed.colwise().sum().transpose() / static_cast<double>(overlap.rows.size());
}

Eigen::VectorXd nonzeroScores(const DataMatrix& data,
                              const SignatureRows& overlap,
                              const BoolMatrix& zeroLocations) {
    Eigen::VectorXd scores = Eigen::VectorXd::Zero(data.numSamples());
    for (int s = 0; s < data.numSamples(); ++s) {
        double sum = 0.0;
        int count = 0;
        for (size_t i = 0; i < overlap.rows.size(); ++i) {
            int row = overlap.rows[i];
            if (!zeroLocations(row, s)) {
                sum += overlap.signs[i] * data.values(row, s);
                ++count;
            }
        }
        scores(s) = count > 0 ? sum / count : 0.0;
    }
    return scores;
}

void checkMask(const DataMatrix& sigData, const BoolMatrix& zeroLocations) {
    if (zeroLocations.rows() != sigData.numGenes() || zeroLocations.cols() != sigData.numSamples()) {
        throw ConsistencyError("Zero-location mask does not match the scored data");
    }
}

Eigen::VectorXd scoreRows(const DataMatrix& sigData,
                          const SignatureRows& overlap,
                          const BoolMatrix& zeroLocations,
                          ScoreMethod method) {
    switch (method) {
        case ScoreMethod::NAIVE:
            return naiveScores(sigData.values, overlap);
        case ScoreMethod::WEIGHTED_AVG:
            return weightedScores(sigData, overlap);
        case ScoreMethod::IMPUTED:
            return imputedScores(sigData, overlap, zeroLocations);
        case ScoreMethod::ONLY_NONZERO:
            return nonzeroScores(sigData, overlap, zeroLocations);
        default:
            throw ConfigurationError("Unknown signature score method");
    }
}

} // namespace

KindScoringConfig scoringConfigFor(ModelKind kind, const AnalysisParameters& params) {
    switch (kind) {
        case ModelKind::EXPRESSION:
            return {params.sigNormMethod, params.sigScoreMethod};
        case ModelKind::PROBABILITY:
            return {NormalizationMethod::NONE, ScoreMethod::NAIVE};
        default:
            throw ConfigurationError("No scoring configuration for model kind");
    }
}

ScoreOutcome scoreSignature(const DataMatrix& sigData,
                            const Signature& signature,
                            const BoolMatrix& zeroLocations,
                            int minSignatureGenes,
                            ScoreMethod method) {
    checkMask(sigData, zeroLocations);

    SignatureRows overlap = overlappingRows(sigData, signature);
    int numGenes = overlap.rows.size();
    if (numGenes == 0 || numGenes < minSignatureGenes) {
        return CoverageSkip{signature.name(), numGenes, minSignatureGenes};
    }

    return SignatureScore(signature.name(), sigData.sampleLabels,
                          scoreRows(sigData, overlap, zeroLocations, method), false, false, numGenes);
}

BatchResult scoreSignatures(const DataMatrix& sigData,
                            const std::vector<Signature>& signatures,
                            const BoolMatrix& zeroLocations,
                            int minSignatureGenes,
                            ScoreMethod method,
                            const ProgressCallback& progress,
                            const std::string& stage) {
    int total = signatures.size();
    std::vector<ScoreOutcome> outcomes(total, CoverageSkip{});
    std::exception_ptr failure;

    for (int chunkStart = 0; chunkStart < total; chunkStart += BATCH_CHUNK) {
        int chunkEnd = std::min(chunkStart + BATCH_CHUNK, total);

        #pragma omp parallel for schedule(dynamic)
        for (int i = chunkStart; i < chunkEnd; ++i) {
            try {
                outcomes[i] = scoreSignature(sigData, signatures[i], zeroLocations, minSignatureGenes, method);
            } catch (...) {
                #pragma omp critical
                {
                    if (!failure) {
                        failure = std::current_exception();
                    }
                }
            }
        }

        if (failure) {
            std::rethrow_exception(failure);
        }
        if (progress) {
            progress(stage, chunkEnd, total);
        }
    }

    BatchResult result;
    for (auto& outcome : outcomes) {
        if (auto* score = std::get_if<SignatureScore>(&outcome)) {
            std::string name = score->name;
            result.scores.emplace(name, std::move(*score));
        } else {
            result.skipped.push_back(std::get<CoverageSkip>(outcome));
        }
    }
    return result;
}

ScoreMatrix scoreSignatureMatrix(const DataMatrix& sigData,
                                 const std::vector<Signature>& signatures,
                                 const BoolMatrix& zeroLocations,
                                 int minSignatureGenes,
                                 ScoreMethod method,
                                 const ProgressCallback& progress,
                                 const std::string& stage) {
    checkMask(sigData, zeroLocations);

    int total = signatures.size();
    Eigen::MatrixXd values(sigData.numSamples(), total);
    std::vector<int> numGenes(total, 0);
    std::exception_ptr failure;

    for (int chunkStart = 0; chunkStart < total; chunkStart += BATCH_CHUNK) {
        int chunkEnd = std::min(chunkStart + BATCH_CHUNK, total);

        #pragma omp parallel for schedule(dynamic)
        for (int i = chunkStart; i < chunkEnd; ++i) {
            try {
                SignatureRows overlap = overlappingRows(sigData, signatures[i]);
                int covered = overlap.rows.size();
                if (covered > 0 && covered >= minSignatureGenes) {
                    values.col(i) = scoreRows(sigData, overlap, zeroLocations, method);
                    numGenes[i] = covered;
                }
            } catch (...) {
                #pragma omp critical
                {
                    if (!failure) {
                        failure = std::current_exception();
                    }
                }
            }
        }

        if (failure) {
            std::rethrow_exception(failure);
        }
        if (progress) {
            progress(stage, chunkEnd, total);
        }
    }

    // Columns of uncovered signatures are dropped in place
    ScoreMatrix result;
    result.sampleLabels = sigData.sampleLabels;
    int kept = 0;
    for (int i = 0; i < total; ++i) {
        if (numGenes[i] == 0) {
            continue;
        }
        if (kept != i) {
            values.col(kept) = values.col(i);
        }
        result.names.push_back(signatures[i].name());
        result.numGenes.push_back(numGenes[i]);
        ++kept;
    }
    values.conservativeResize(Eigen::NoChange, kept);
    result.values = std::move(values);
    return result;
}

Eigen::VectorXd zeroProportion(const Eigen::MatrixXd& data) {
    Eigen::VectorXd proportion = Eigen::VectorXd::Zero(data.cols());
    if (data.rows() == 0) {
        return proportion;
    }
    for (int s = 0; s < data.cols(); ++s) {
        proportion(s) = static_cast<double>((data.col(s).array() == 0.0).count()) / data.rows();
    }
    return proportion;
}

ScoreMethod parseMethod(const std::string& name) {
    if (name == "naive") {
        return ScoreMethod::NAIVE;
    } else if (name == "weighted_avg") {
        return ScoreMethod::WEIGHTED_AVG;
    } else if (name == "imputed") {
        return ScoreMethod::IMPUTED;
    } else if (name == "only_nonzero") {
        return ScoreMethod::ONLY_NONZERO;
    }
    throw ConfigurationError("Unknown signature score method: " + name);
}

std::string methodName(ScoreMethod method) {
    switch (method) {
        case ScoreMethod::NAIVE:
            return "naive";
        case ScoreMethod::WEIGHTED_AVG:
            return "weighted_avg";
        case ScoreMethod::IMPUTED:
            return "imputed";
        case ScoreMethod::ONLY_NONZERO:
            return "only_nonzero";
        default:
            throw ConfigurationError("Unknown signature score method");
    }
}

std::vector<std::string> availableMethods() {
    return {"naive", "weighted_avg", "imputed", "only_nonzero"};
}

} // namespace scoring
} // namespace sigproj
