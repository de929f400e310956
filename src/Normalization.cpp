#include "Normalization.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace sigproj {
namespace normalization {

namespace {

constexpr double MIN_SD = 1e-12;

} // namespace

RowStatistics computeRowStatistics(const Eigen::MatrixXd& data) {
    RowStatistics stats;
    stats.mean = data.rowwise().mean();
    stats.sd = Eigen::VectorXd::Zero(data.rows());
    if (data.cols() > 1) {
        for (int i = 0; i < data.rows(); ++i) {
            double ss = (data.row(i).array() - stats.mean(i)).square().sum();
            stats.sd(i) = std::sqrt(ss / (data.cols() - 1));
        }
    }
    return stats;
}

Eigen::MatrixXd zNormalizeRows(const Eigen::MatrixXd& data, const RowStatistics& stats) {
    if (stats.mean.size() != data.rows() || stats.sd.size() != data.rows()) {
        throw ConsistencyError("Row statistics do not match the number of genes");
    }
    Eigen::MatrixXd result(data.rows(), data.cols());
    for (int i = 0; i < data.rows(); ++i) {
        if (stats.sd(i) < MIN_SD) {
            result.row(i).setZero();
        } else {
            result.row(i) = (data.row(i).array() - stats.mean(i)) / stats.sd(i);
        }
    }
    return result;
}

Eigen::MatrixXd zNormalizeColumns(const Eigen::MatrixXd& data) {
    Eigen::MatrixXd transposed = data.transpose();
    return zNormalizeRows(transposed, computeRowStatistics(transposed)).transpose();
}

Eigen::MatrixXd rankNormalizeColumns(const Eigen::MatrixXd& data) {
    int nRows = data.rows();
    Eigen::MatrixXd result(nRows, data.cols());

    for (int j = 0; j < data.cols(); ++j) {
        std::vector<std::pair<double, int>> colWithIdx(nRows);
        for (int i = 0; i < nRows; ++i) {
            colWithIdx[i] = {data(i, j), i};
        }
        std::sort(colWithIdx.begin(), colWithIdx.end());

        // Average ranks across ties
        int start = 0;
        while (start < nRows) {
            int end = start;
            while (end + 1 < nRows && colWithIdx[end + 1].first == colWithIdx[start].first) {
                ++end;
            }
            double rank = 0.5 * (start + end);
            for (int k = start; k <= end; ++k) {
                result(colWithIdx[k].second, j) = nRows > 1 ? rank / (nRows - 1) : 0.0;
            }
            start = end + 1;
        }
    }
    return result;
}

Eigen::MatrixXd normalize(const Eigen::MatrixXd& data, NormalizationMethod method) {
    return normalize(data, method, computeRowStatistics(data));
}

Eigen::MatrixXd normalize(const Eigen::MatrixXd& data,
                          NormalizationMethod method,
                          const RowStatistics& reference) {
    switch (method) {
        case NormalizationMethod::NONE:
            return data;
        case NormalizationMethod::ZNORM_COLUMNS:
            return zNormalizeColumns(data);
        case NormalizationMethod::ZNORM_ROWS:
            return zNormalizeRows(data, reference);
        case NormalizationMethod::ZNORM_ROWS_THEN_COLUMNS:
            return zNormalizeColumns(zNormalizeRows(data, reference));
        case NormalizationMethod::RANK_NORM_COLUMNS:
            return rankNormalizeColumns(data);
        default:
            throw ConfigurationError("Unknown normalization method");
    }
}

NormalizationMethod parseMethod(const std::string& name) {
    if (name == "none") {
        return NormalizationMethod::NONE;
    } else if (name == "znorm_columns") {
        return NormalizationMethod::ZNORM_COLUMNS;
    } else if (name == "znorm_rows") {
        return NormalizationMethod::ZNORM_ROWS;
    } else if (name == "znorm_rows_then_columns") {
        return NormalizationMethod::ZNORM_ROWS_THEN_COLUMNS;
    } else if (name == "rank_norm_columns") {
        return NormalizationMethod::RANK_NORM_COLUMNS;
    }
    throw ConfigurationError("Unknown normalization method: " + name);
}

std::string methodName(NormalizationMethod method) {
    switch (method) {
        case NormalizationMethod::NONE:
            return "none";
        case NormalizationMethod::ZNORM_COLUMNS:
            return "znorm_columns";
        case NormalizationMethod::ZNORM_ROWS:
            return "znorm_rows";
        case NormalizationMethod::ZNORM_ROWS_THEN_COLUMNS:
            return "znorm_rows_then_columns";
        case NormalizationMethod::RANK_NORM_COLUMNS:
            return "rank_norm_columns";
        default:
            throw ConfigurationError("Unknown normalization method");
    }
}

std::vector<std::string> availableMethods() {
    return {"none", "znorm_columns", "znorm_rows", "znorm_rows_then_columns", "rank_norm_columns"};
}

} // namespace normalization
} // namespace sigproj
