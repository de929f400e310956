#include "DataMatrix.hpp"
#include "Errors.hpp"
#include <gtest/gtest.h>

using namespace sigproj;

namespace {

DataMatrix smallMatrix() {
    Eigen::MatrixXd values(3, 4);
    values << 1, 0, 3, 4,
              0, 0, 7, 8,
              9, 10, 0, 12;
    DataMatrix data(values, {"A", "B", "C"}, {"s1", "s2", "s3", "s4"});
    data.filters["first_two"] = {"A", "B"};
    data.filters["only_c"] = {"C"};
    return data;
}

} // namespace

TEST(DataMatrixTest, RejectsShapeMismatch) {
    Eigen::MatrixXd values = Eigen::MatrixXd::Zero(2, 3);
    EXPECT_THROW(DataMatrix(values, {"A", "B"}, {"s1", "s2"}), ConsistencyError);
    EXPECT_THROW(DataMatrix(values, {"A"}, {"s1", "s2", "s3"}), ConsistencyError);
}

TEST(DataMatrixTest, LooksUpLabels) {
    DataMatrix data = smallMatrix();
    EXPECT_EQ(data.numGenes(), 3);
    EXPECT_EQ(data.numSamples(), 4);
    EXPECT_EQ(data.geneIndex("B"), 1);
    EXPECT_EQ(data.geneIndex("Z"), -1);
    EXPECT_EQ(data.sampleIndex("s4"), 3);
    EXPECT_EQ(data.sampleIndex("missing"), -1);
    EXPECT_FALSE(data.hasWeights());
}

TEST(DataMatrixTest, SubsetSamplesFollowsLabelOrder) {
    DataMatrix data = smallMatrix();
    data.weights = Eigen::MatrixXd::Constant(3, 4, 0.5);
    data.weights(0, 2) = 0.25;

    DataMatrix subset = data.subsetSamples(std::vector<std::string>{"s3", "s1"});
    ASSERT_EQ(subset.numSamples(), 2);
    EXPECT_EQ(subset.sampleLabels, (std::vector<std::string>{"s3", "s1"}));
    EXPECT_DOUBLE_EQ(subset.values(0, 0), 3.0);
    EXPECT_DOUBLE_EQ(subset.values(0, 1), 1.0);
    EXPECT_DOUBLE_EQ(subset.weights(0, 0), 0.25);
    EXPECT_EQ(subset.filters.size(), 2u);
    EXPECT_EQ(subset.sampleIndex("s1"), 1);

    EXPECT_THROW(data.subsetSamples(std::vector<std::string>{"nope"}), ConsistencyError);
}

TEST(DataMatrixTest, SubsetSamplesByMask) {
    DataMatrix data = smallMatrix();
    DataMatrix subset = data.subsetSamples(std::vector<bool>{true, false, false, true});
    EXPECT_EQ(subset.sampleLabels, (std::vector<std::string>{"s1", "s4"}));
    EXPECT_THROW(data.subsetSamples(std::vector<bool>{true}), ConsistencyError);
}

TEST(DataMatrixTest, SubsetGenesPrunesFilters) {
    DataMatrix data = smallMatrix();
    DataMatrix subset = data.subsetGenes({2, 0});
    EXPECT_EQ(subset.geneNames, (std::vector<std::string>{"C", "A"}));
    EXPECT_DOUBLE_EQ(subset.values(0, 0), 9.0);
    EXPECT_EQ(subset.filteredGenes("first_two"), (std::vector<std::string>{"A"}));
    EXPECT_EQ(subset.filteredGenes("only_c"), (std::vector<std::string>{"C"}));
    EXPECT_THROW(data.subsetGenes({3}), ConsistencyError);
}

TEST(DataMatrixTest, FilteredRestrictsRows) {
    DataMatrix data = smallMatrix();
    DataMatrix filtered = data.filtered("first_two");
    EXPECT_EQ(filtered.geneNames, (std::vector<std::string>{"A", "B"}));
    EXPECT_TRUE(filtered.filters.empty());
    EXPECT_EQ(data.filterNames(), (std::vector<std::string>{"first_two", "only_c"}));
    EXPECT_THROW(data.filtered("unknown"), ProcessingError);
}

TEST(DataMatrixTest, ConcatenatesSamples) {
    DataMatrix data = smallMatrix();
    DataMatrix left = data.subsetSamples(std::vector<std::string>{"s1", "s2"});
    DataMatrix right = data.subsetSamples(std::vector<std::string>{"s3"});

    DataMatrix merged = left.concatenateSamples(right);
    EXPECT_EQ(merged.sampleLabels, (std::vector<std::string>{"s1", "s2", "s3"}));
    EXPECT_DOUBLE_EQ(merged.values(1, 2), 7.0);
    EXPECT_EQ(merged.sampleIndex("s3"), 2);

    DataMatrix otherGenes = data.subsetGenes({0, 1});
    EXPECT_THROW(data.concatenateSamples(otherGenes), ConsistencyError);
}

TEST(DataMatrixTest, ZeroLocations) {
    BoolMatrix zeros = smallMatrix().zeroLocations();
    EXPECT_TRUE(zeros(0, 1));
    EXPECT_TRUE(zeros(1, 0));
    EXPECT_FALSE(zeros(2, 1));
    EXPECT_EQ(zeros.count(), 4);
}
