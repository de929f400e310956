#include "Filters.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace sigproj {
namespace filters {

std::vector<std::string> thresholdFilter(const DataMatrix& data, int threshold) {
    std::vector<std::string> genes;
    for (int i = 0; i < data.numGenes(); ++i) {
        int detected = (data.values.row(i).array() != 0.0).count();
        if (detected >= threshold) {
            genes.push_back(data.geneNames[i]);
        }
    }
    return genes;
}

std::vector<std::string> highDispersionFilter(const DataMatrix& data,
                                              const std::vector<std::string>& candidates,
                                              int numBins,
                                              double zCutoff) {
    struct GeneDispersion {
        std::string gene;
        double mean;
        double logFano;
    };

    std::vector<GeneDispersion> dispersions;
    for (const auto& gene : candidates) {
        int row = data.geneIndex(gene);
        if (row < 0) {
            continue;
        }
        Eigen::ArrayXd x = data.values.row(row).array();
        double mean = x.mean();
        if (mean <= 0.0 || x.size() < 2) {
            continue;
        }
        double variance = (x - mean).square().sum() / (x.size() - 1);
        if (variance <= 0.0) {
            continue;
        }
        dispersions.push_back({gene, mean, std::log(variance / mean)});
    }

    if (dispersions.empty()) {
        return {};
    }

    std::sort(dispersions.begin(), dispersions.end(),
              [](const GeneDispersion& a, const GeneDispersion& b) { return a.mean < b.mean; });

    // Quantile bins over the mean, each scored against its own dispersion spread
    int n = dispersions.size();
    int bins = std::max(1, std::min(numBins, n));
    std::vector<std::string> selected;
    for (int b = 0; b < bins; ++b) {
        int start = static_cast<int>(static_cast<long long>(b) * n / bins);
        int end = static_cast<int>(static_cast<long long>(b + 1) * n / bins);
        if (end <= start) {
            continue;
        }

        double sum = 0.0;
        for (int i = start; i < end; ++i) {
            sum += dispersions[i].logFano;
        }
        double binMean = sum / (end - start);
        double ss = 0.0;
        for (int i = start; i < end; ++i) {
            ss += (dispersions[i].logFano - binMean) * (dispersions[i].logFano - binMean);
        }
        double binSd = end - start > 1 ? std::sqrt(ss / (end - start - 1)) : 0.0;
        if (binSd <= 0.0) {
            continue;
        }

        for (int i = start; i < end; ++i) {
            if ((dispersions[i].logFano - binMean) / binSd >= zCutoff) {
                selected.push_back(dispersions[i].gene);
            }
        }
    }

    // Keep the matrix's row order
    std::sort(selected.begin(), selected.end(), [&data](const std::string& a, const std::string& b) {
        return data.geneIndex(a) < data.geneIndex(b);
    });
    return selected;
}

DataMatrix applyFilters(const DataMatrix& data,
                        int threshold,
                        bool disable,
                        bool lean,
                        std::vector<std::string>* warnings) {
    DataMatrix result = data;
    result.filters.clear();

    if (disable) {
        result.filters[NO_FILTER] = data.geneNames;
    } else {
        std::vector<std::string> passing = thresholdFilter(data, threshold);
        if (!passing.empty()) {
            result.filters[THRESHOLD_FILTER] = passing;
        } else if (warnings) {
            warnings->push_back("Threshold filter removed every gene (threshold " +
                                std::to_string(threshold) + ")");
        }

        if (!lean) {
            std::vector<std::string> dispersed = highDispersionFilter(data, passing);
            if (!dispersed.empty()) {
                result.filters[HDT_FILTER] = dispersed;
            } else if (warnings) {
                warnings->push_back("HDT filter selected no genes");
            }
        }
    }

    if (result.filters.empty()) {
        throw ProcessingError("No gene passed any filter");
    }
    return result;
}

} // namespace filters
} // namespace sigproj
