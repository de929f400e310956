#pragma once

#include "DataStructures.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace sigproj {
namespace normalization {

// Per-gene mean and standard deviation of a reference matrix
struct RowStatistics {
    Eigen::VectorXd mean;
    Eigen::VectorXd sd;
};

RowStatistics computeRowStatistics(const Eigen::MatrixXd& data);

Eigen::MatrixXd normalize(const Eigen::MatrixXd& data, NormalizationMethod method);

// Row-based methods use the supplied statistics instead of the data's own rows
Eigen::MatrixXd normalize(const Eigen::MatrixXd& data,
                          NormalizationMethod method,
                          const RowStatistics& reference);

Eigen::MatrixXd zNormalizeColumns(const Eigen::MatrixXd& data);
Eigen::MatrixXd zNormalizeRows(const Eigen::MatrixXd& data, const RowStatistics& stats);
Eigen::MatrixXd rankNormalizeColumns(const Eigen::MatrixXd& data);

// Throws ConfigurationError for unknown names
NormalizationMethod parseMethod(const std::string& name);
std::string methodName(NormalizationMethod method);
std::vector<std::string> availableMethods();

} // namespace normalization
} // namespace sigproj
