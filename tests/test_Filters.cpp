#include "Errors.hpp"
#include "Filters.hpp"
#include "TestData.hpp"
#include <gtest/gtest.h>

using namespace sigproj;

namespace {

// Gene detections: A in all 10 samples, B in 3, C in none, D in 5
DataMatrix detectionMatrix() {
    Eigen::MatrixXd values = Eigen::MatrixXd::Zero(4, 10);
    values.row(0).setConstant(2.0);
    values.row(1).head(3).setConstant(1.0);
    values.row(3).head(5).setConstant(4.0);
    return DataMatrix(values, {"A", "B", "C", "D"}, testdata::numberedLabels("S", 10));
}

// Twenty genes with the same dispersion and one heavily over-dispersed gene
DataMatrix dispersionMatrix() {
    Eigen::MatrixXd values(21, 10);
    for (int g = 0; g < 20; ++g) {
        for (int s = 0; s < 10; ++s) {
            values(g, s) = s % 2 == 0 ? 1.0 : 3.0;
        }
    }
    values.row(20).setZero();
    values(20, 9) = 20.0;
    return DataMatrix(values, testdata::numberedLabels("G", 21), testdata::numberedLabels("S", 10));
}

} // namespace

TEST(FiltersTest, ThresholdCountsDetections) {
    DataMatrix data = detectionMatrix();
    EXPECT_EQ(filters::thresholdFilter(data, 5), (std::vector<std::string>{"A", "D"}));
    EXPECT_EQ(filters::thresholdFilter(data, 3), (std::vector<std::string>{"A", "B", "D"}));
    EXPECT_EQ(filters::thresholdFilter(data, 0).size(), 4u);
}

TEST(FiltersTest, DisabledFilterKeepsEveryGene) {
    DataMatrix data = detectionMatrix();
    DataMatrix filtered = filters::applyFilters(data, 5, true, false);
    ASSERT_EQ(filtered.filters.size(), 1u);
    EXPECT_EQ(filtered.filteredGenes(filters::NO_FILTER), data.geneNames);
    EXPECT_EQ(filtered.numGenes(), data.numGenes());
}

TEST(FiltersTest, LeanSkipsDispersionFilter) {
    DataMatrix filtered = filters::applyFilters(detectionMatrix(), 5, false, true);
    EXPECT_EQ(filtered.filterNames(), (std::vector<std::string>{filters::THRESHOLD_FILTER}));
}

TEST(FiltersTest, EmptyFiltersAreReportedAndFailTogether) {
    std::vector<std::string> warnings;
    EXPECT_THROW(filters::applyFilters(detectionMatrix(), 11, false, true, &warnings), ProcessingError);
    EXPECT_FALSE(warnings.empty());
}

TEST(FiltersTest, HighDispersionPicksOverdispersedGene) {
    DataMatrix data = dispersionMatrix();
    std::vector<std::string> selected = filters::highDispersionFilter(data, data.geneNames, 1, 1.65);
    EXPECT_EQ(selected, (std::vector<std::string>{"G20"}));
}

TEST(FiltersTest, DispersionNeedsPopulatedBins) {
    // 21 genes over 30 bins leaves one gene per bin and nothing to compare against
    DataMatrix data = dispersionMatrix();
    std::vector<std::string> warnings;
    DataMatrix filtered = filters::applyFilters(data, 1, false, false, &warnings);
    EXPECT_EQ(filtered.filteredGenes(filters::THRESHOLD_FILTER).size(), 21u);
    EXPECT_EQ(filtered.filters.count(filters::HDT_FILTER), 0u);
    ASSERT_EQ(warnings.size(), 1u);
}
