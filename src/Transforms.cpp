#include "Transforms.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>

namespace sigproj {
namespace transforms {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double MIN_MU_LOW = 1e-2;
constexpr double MIN_SIGMA_HIGH = 5e-2;
constexpr double MAD_SCALE = 1.4826;

struct GeneMixture {
    double muHigh;
    double muLow;
    double sigmaHigh;
    double weight;
};

double normalDensity(double x, double mu, double sigma) {
    double z = (x - mu) / sigma;
    return std::exp(-0.5 * z * z) / (sigma * std::sqrt(2.0 * PI));
}

double exponentialDensity(double x, double mu) {
    return std::exp(-x / mu) / mu;
}

double posteriorDetected(double x, const GeneMixture& m) {
    if (m.weight <= 0.0) {
        return 0.0;
    }
    double high = m.weight * normalDensity(x, m.muHigh, m.sigmaHigh);
    double low = (1.0 - m.weight) * exponentialDensity(x, m.muLow);
    double total = high + low;
    if (total <= 0.0) {
        // Both densities underflowed; decide by which side of the normal mean x falls
        return x >= m.muHigh ? 1.0 : 0.0;
    }
    return high / total;
}

GeneMixture fitGene(const Eigen::VectorXd& x, int maxIterations, double tolerance, Eigen::VectorXd& posterior) {
    int n = x.size();
    double cutoff = x.mean() / 4.0;

    GeneMixture m{0.0, MIN_MU_LOW, 1.0, 0.0};
    posterior = Eigen::VectorXd::Zero(n);

    int nHigh = 0;
    double sumHigh = 0.0;
    double sumLow = 0.0;
    for (int i = 0; i < n; ++i) {
        if (x(i) > cutoff) {
            ++nHigh;
            sumHigh += x(i);
        } else {
            sumLow += x(i);
        }
    }
    if (nHigh == 0) {
        return m;   // Never detected
    }

    m.muHigh = sumHigh / nHigh;
    double ssHigh = 0.0;
    for (int i = 0; i < n; ++i) {
        if (x(i) > cutoff) {
            ssHigh += (x(i) - m.muHigh) * (x(i) - m.muHigh);
        }
    }
    m.sigmaHigh = std::max(std::sqrt(ssHigh / nHigh), MIN_SIGMA_HIGH);
    m.muLow = nHigh < n ? std::max(sumLow / (n - nHigh), MIN_MU_LOW) : MIN_MU_LOW;
    m.weight = std::min(std::max(static_cast<double>(nHigh) / n, 0.01), 0.99);

    for (int iter = 0; iter < maxIterations; ++iter) {
        for (int i = 0; i < n; ++i) {
            posterior(i) = posteriorDetected(x(i), m);
        }

        double sumG = posterior.sum();
        double sumNotG = n - sumG;
        if (sumG < 1e-8) {
            m.weight = 0.0;
            break;
        }

        double muHigh = posterior.dot(x) / sumG;
        double ss = 0.0;
        for (int i = 0; i < n; ++i) {
            ss += posterior(i) * (x(i) - muHigh) * (x(i) - muHigh);
        }
        double muLow = MIN_MU_LOW;
        if (sumNotG > 1e-8) {
            muLow = std::max((x.sum() - posterior.dot(x)) / sumNotG, MIN_MU_LOW);
        }
        double weight = sumG / n;

        bool converged = std::abs(weight - m.weight) < tolerance;
        m.muHigh = muHigh;
        m.sigmaHigh = std::max(std::sqrt(ss / sumG), MIN_SIGMA_HIGH);
        m.muLow = muLow;
        m.weight = weight;
        if (converged) {
            break;
        }
    }

    for (int i = 0; i < n; ++i) {
        posterior(i) = posteriorDetected(x(i), m);
    }
    return m;
}

double sigmoid(double t) {
    return 1.0 / (1.0 + std::exp(-t));
}

double median(std::vector<double> values) {
    if (values.empty()) {
        return 0.0;
    }
    size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    double upper = values[mid];
    if (values.size() % 2 == 1) {
        return upper;
    }
    double lower = *std::max_element(values.begin(), values.begin() + mid);
    return 0.5 * (lower + upper);
}

} // namespace

ProbabilityFit probabilityOfExpression(const DataMatrix& data, int maxIterations, double tolerance) {
    int nGenes = data.numGenes();
    ProbabilityFit fit;
    fit.probabilities = Eigen::MatrixXd::Zero(nGenes, data.numSamples());
    fit.parameters.geneNames = data.geneNames;
    fit.parameters.muHigh.resize(nGenes);
    fit.parameters.muLow.resize(nGenes);
    fit.parameters.sigmaHigh.resize(nGenes);
    fit.parameters.mixtureWeight.resize(nGenes);

    #pragma omp parallel for schedule(dynamic, 64)
    for (int g = 0; g < nGenes; ++g) {
        Eigen::VectorXd x = data.values.row(g).transpose();
        Eigen::VectorXd posterior;
        GeneMixture m = fitGene(x, maxIterations, tolerance, posterior);
        fit.probabilities.row(g) = posterior.transpose();
        fit.parameters.muHigh(g) = m.muHigh;
        fit.parameters.muLow(g) = m.muLow;
        fit.parameters.sigmaHigh(g) = m.sigmaHigh;
        fit.parameters.mixtureWeight(g) = m.weight;
    }

    for (int g = 0; g < nGenes; ++g) {
        if (!std::isfinite(fit.parameters.muHigh(g)) || !std::isfinite(fit.parameters.sigmaHigh(g)) ||
            !std::isfinite(fit.parameters.muLow(g)) || !std::isfinite(fit.parameters.mixtureWeight(g)) ||
            !fit.probabilities.row(g).allFinite()) {
            throw FittingError("Mixture fit did not converge for gene " + data.geneNames[g]);
        }
    }
    return fit;
}

MixtureSummary summarizeMixture(const ProbabilityParameters& parameters) {
    MixtureSummary summary;
    int detected = 0;
    for (int g = 0; g < parameters.mixtureWeight.size(); ++g) {
        if (parameters.mixtureWeight(g) <= 0.0) {
            continue;
        }
        summary.muHigh += parameters.muHigh(g);
        summary.muLow += parameters.muLow(g);
        summary.sigmaHigh += parameters.sigmaHigh(g);
        summary.mixtureWeight += parameters.mixtureWeight(g);
        ++detected;
    }
    if (detected > 0) {
        summary.muHigh /= detected;
        summary.muLow /= detected;
        summary.sigmaHigh /= detected;
        summary.mixtureWeight /= detected;
    }
    return summary;
}

Eigen::MatrixXd applyProbabilityModel(const DataMatrix& data, const ProbabilityParameters& parameters) {
    std::unordered_map<std::string, int> paramIndex;
    for (size_t i = 0; i < parameters.geneNames.size(); ++i) {
        paramIndex[parameters.geneNames[i]] = static_cast<int>(i);
    }

    Eigen::MatrixXd probabilities(data.numGenes(), data.numSamples());
    for (int g = 0; g < data.numGenes(); ++g) {
        auto it = paramIndex.find(data.geneNames[g]);
        if (it == paramIndex.end()) {
            throw ConsistencyError("No mixture parameters for gene " + data.geneNames[g]);
        }
        int p = it->second;
        GeneMixture m{parameters.muHigh(p), parameters.muLow(p),
                      parameters.sigmaHigh(p), parameters.mixtureWeight(p)};
        for (int s = 0; s < data.numSamples(); ++s) {
            probabilities(g, s) = posteriorDetected(data.values(g, s), m);
        }
    }
    return probabilities;
}

Eigen::VectorXd detectedGeneLevels(const Eigen::MatrixXd& data) {
    Eigen::VectorXd levels = Eigen::VectorXd::Zero(data.rows());
    for (int g = 0; g < data.rows(); ++g) {
        int detected = 0;
        double sum = 0.0;
        for (int s = 0; s < data.cols(); ++s) {
            if (data(g, s) != 0.0) {
                ++detected;
                sum += data(g, s);
            }
        }
        if (detected > 0) {
            levels(g) = sum / detected;
        }
    }
    return levels;
}

Eigen::Vector2d FalseNegativeModel::fitLogistic(const Eigen::VectorXd& levels,
                                                const Eigen::VectorXd& undetected) {
    const double ridge = 1e-2;
    int n = levels.size();

    // Standardized predictor keeps the Newton steps well conditioned
    double center = levels.mean();
    double spread = std::sqrt((levels.array() - center).square().sum() / std::max(n - 1, 1));
    if (spread <= 0.0) {
        spread = 1.0;
    }
    Eigen::VectorXd z = (levels.array() - center) / spread;

    double rate = std::min(std::max(undetected.mean(), 1e-3), 1.0 - 1e-3);
    Eigen::Vector2d beta(std::log(rate / (1.0 - rate)), 0.0);

    for (int iter = 0; iter < 50; ++iter) {
        Eigen::Vector2d gradient = -ridge * beta;
        Eigen::Matrix2d hessian = ridge * Eigen::Matrix2d::Identity();
        for (int i = 0; i < n; ++i) {
            double p = sigmoid(beta(0) + beta(1) * z(i));
            double w = p * (1.0 - p);
            gradient(0) += undetected(i) - p;
            gradient(1) += (undetected(i) - p) * z(i);
            hessian(0, 0) += w;
            hessian(0, 1) += w * z(i);
            hessian(1, 1) += w * z(i) * z(i);
        }
        hessian(1, 0) = hessian(0, 1);

        Eigen::Vector2d step = hessian.ldlt().solve(gradient);
        beta += step;
        if (step.cwiseAbs().maxCoeff() < 1e-8) {
            break;
        }
    }

    // Back to the original scale of the gene levels
    Eigen::Vector2d result(beta(0) - beta(1) * center / spread, beta(1) / spread);
    if (!result.allFinite()) {
        throw FittingError("False-negative curve fit produced non-finite parameters");
    }
    return result;
}

FalseNegativeModel FalseNegativeModel::fit(const DataMatrix& original,
                                           const std::vector<std::string>& housekeepingGenes,
                                           std::vector<std::string>* warnings) {
    Eigen::VectorXd levels = detectedGeneLevels(original.values);

    std::vector<std::string> usable;
    std::unordered_set<std::string> seen;
    for (const auto& gene : housekeepingGenes) {
        int row = original.geneIndex(gene);
        if (row >= 0 && levels(row) > 0.0 && seen.insert(gene).second) {
            usable.push_back(gene);
        }
    }

    if (usable.size() < 2) {
        if (warnings) {
            warnings->push_back("Fewer than two housekeeping genes found in the data; "
                                "using all detected genes for the false-negative curve");
        }
        usable.clear();
        for (int g = 0; g < original.numGenes(); ++g) {
            if (levels(g) > 0.0) {
                usable.push_back(original.geneNames[g]);
            }
        }
    }
    if (usable.size() < 2) {
        throw FittingError("Not enough detected genes to fit a false-negative curve");
    }

    FalseNegativeModel model;
    model.genes = usable;
    model.geneLevels.resize(usable.size());
    for (size_t i = 0; i < usable.size(); ++i) {
        model.geneLevels(i) = levels(original.geneIndex(usable[i]));
    }
    return model.fitSamples(original);
}

FalseNegativeModel FalseNegativeModel::fitSamples(const DataMatrix& data) const {
    std::vector<int> rows;
    rows.reserve(genes.size());
    for (const auto& gene : genes) {
        int row = data.geneIndex(gene);
        if (row < 0) {
            throw ConsistencyError("False-negative curve gene missing from data: " + gene);
        }
        rows.push_back(row);
    }

    FalseNegativeModel model;
    model.genes = genes;
    model.geneLevels = geneLevels;
    model.samples = data.sampleLabels;
    model.params.resize(2, data.numSamples());

    for (int s = 0; s < data.numSamples(); ++s) {
        Eigen::VectorXd undetected(rows.size());
        for (size_t i = 0; i < rows.size(); ++i) {
            undetected(i) = data.values(rows[i], s) == 0.0 ? 1.0 : 0.0;
        }
        model.params.col(s) = fitLogistic(geneLevels, undetected);
    }
    return model;
}

double FalseNegativeModel::probability(double geneLevel, int sample) const {
    return sigmoid(params(0, sample) + params(1, sample) * geneLevel);
}

Eigen::VectorXd FalseNegativeModel::qualityScores() const {
    Eigen::VectorXd scores(params.cols());
    for (int s = 0; s < params.cols(); ++s) {
        double sum = 0.0;
        for (int i = 0; i < geneLevels.size(); ++i) {
            sum += probability(geneLevels(i), s);
        }
        scores(s) = sum / geneLevels.size();
    }
    return scores;
}

Eigen::MatrixXd computeWeights(const FalseNegativeModel& model,
                               const DataMatrix& data,
                               const Eigen::VectorXd* referenceLevels) {
    if (model.sampleLabels() != data.sampleLabels) {
        throw ConsistencyError("False-negative model samples do not match the data");
    }
    if (referenceLevels && referenceLevels->size() != data.numGenes()) {
        throw ConsistencyError("Reference gene levels do not match the data");
    }

    Eigen::VectorXd levels = referenceLevels ? *referenceLevels : detectedGeneLevels(data.values);
    Eigen::MatrixXd weights = Eigen::MatrixXd::Ones(data.numGenes(), data.numSamples());
    for (int s = 0; s < data.numSamples(); ++s) {
        for (int g = 0; g < data.numGenes(); ++g) {
            if (data.values(g, s) == 0.0) {
                weights(g, s) = 1.0 - model.probability(levels(g), s);
            }
        }
    }
    return weights;
}

Eigen::MatrixXd alignWeights(const DataMatrix& externalWeights, const DataMatrix& data) {
    Eigen::MatrixXd aligned(data.numGenes(), data.numSamples());
    for (int s = 0; s < data.numSamples(); ++s) {
        int col = externalWeights.sampleIndex(data.sampleLabels[s]);
        if (col < 0) {
            throw ConsistencyError("Input weights have no column for sample " + data.sampleLabels[s]);
        }
        for (int g = 0; g < data.numGenes(); ++g) {
            int row = externalWeights.geneIndex(data.geneNames[g]);
            if (row < 0) {
                throw ConsistencyError("Input weights have no row for gene " + data.geneNames[g]);
            }
            aligned(g, s) = std::min(std::max(externalWeights.values(row, col), 0.0), 1.0);
        }
    }
    return aligned;
}

Eigen::MatrixXd adjustProbabilities(const Eigen::MatrixXd& probabilities,
                                    const Eigen::MatrixXd& weights,
                                    const Eigen::MatrixXd& data) {
    if (probabilities.rows() != weights.rows() || probabilities.cols() != weights.cols() ||
        probabilities.rows() != data.rows() || probabilities.cols() != data.cols()) {
        throw ConsistencyError("Probability, weight and data matrices differ in shape");
    }

    Eigen::MatrixXd adjusted(probabilities.rows(), probabilities.cols());
    for (int g = 0; g < probabilities.rows(); ++g) {
        int detected = 0;
        double sum = 0.0;
        for (int s = 0; s < probabilities.cols(); ++s) {
            if (data(g, s) != 0.0) {
                ++detected;
                sum += probabilities(g, s);
            }
        }
        double detectedMean = detected > 0 ? sum / detected : 0.0;
        adjusted.row(g) = weights.row(g).array() * probabilities.row(g).array() +
                          (1.0 - weights.row(g).array()) * detectedMean;
    }
    return adjusted;
}

std::vector<bool> applyQualityCutoff(const Eigen::VectorXd& scores, double cutoff) {
    std::vector<bool> passes(scores.size());
    for (int i = 0; i < scores.size(); ++i) {
        passes[i] = scores(i) <= cutoff;
    }
    return passes;
}

QualityCheck qualityCheck(const FalseNegativeModel& model, double nmads) {
    QualityCheck check;
    check.scores = model.qualityScores();

    std::vector<double> values(check.scores.data(), check.scores.data() + check.scores.size());
    double center = median(values);
    std::vector<double> deviations;
    deviations.reserve(values.size());
    for (double v : values) {
        deviations.push_back(std::abs(v - center));
    }
    double mad = MAD_SCALE * median(deviations);

    check.cutoff = center + nmads * mad;
    check.passes = applyQualityCutoff(check.scores, check.cutoff);
    return check;
}

} // namespace transforms
} // namespace sigproj
