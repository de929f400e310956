#include "Errors.hpp"
#include "Projections.hpp"
#include "TestData.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>

using namespace sigproj;
using namespace sigproj::projections;

TEST(ProjectionsTest, SquaredDistancesBetweenRows) {
    Eigen::MatrixXd points(3, 2);
    points << 0, 0,
              3, 4,
              0, 1;
    Eigen::MatrixXd dist = squaredDistances(points);
    EXPECT_NEAR(dist(0, 1), 25.0, 1e-12);
    EXPECT_NEAR(dist(1, 0), 25.0, 1e-12);
    EXPECT_NEAR(dist(0, 2), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(dist(2, 2), 0.0);
}

TEST(ProjectionsTest, CorrelationBetweenSamples) {
    Eigen::MatrixXd data(4, 3);
    data << 1, 2, 4,
            2, 4, 3,
            3, 6, 2,
            4, 8, 1;
    Eigen::MatrixXd corr = sampleCorrelation(data);
    EXPECT_NEAR(corr(0, 1), 1.0, 1e-12);
    EXPECT_NEAR(corr(0, 2), -1.0, 1e-12);
    EXPECT_NEAR(corr(2, 2), 1.0, 1e-12);
}

TEST(ProjectionsTest, ClassicalMDSPreservesDistances) {
    Eigen::MatrixXd points(4, 2);
    points << 0, 0,
              1, 0,
              0, 2,
              3, 3;
    Eigen::MatrixXd distances = squaredDistances(points).cwiseSqrt();
    Eigen::MatrixXd embedded = classicalMDS(distances, 2);
    Eigen::MatrixXd recovered = squaredDistances(embedded).cwiseSqrt();
    EXPECT_TRUE(recovered.isApprox(distances, 1e-8));
}

TEST(ProjectionsTest, NormalizedProjectionFitsUnitDisk) {
    Eigen::MatrixXd coordinates(3, 2);
    coordinates << 10, 10,
                   12, 10,
                   14, 16;
    Eigen::MatrixXd normalized = normalizeProjection(coordinates);
    EXPECT_NEAR(normalized.col(0).mean(), 0.0, 1e-12);
    EXPECT_NEAR(normalized.col(1).mean(), 0.0, 1e-12);
    EXPECT_NEAR(normalized.rowwise().norm().maxCoeff(), 1.0, 1e-12);
}

TEST(ProjectionsTest, PCAFollowsLargestVariance) {
    Eigen::MatrixXd data(3, 6);
    data << -5, -3, -1, 1, 3, 5,
             1, -1, 0, 0, -1, 1,
             0, 0, 0, 0, 0, 0;
    PCAResult pca = performPCA(data, 2);

    ASSERT_EQ(pca.scores.rows(), 2);
    ASSERT_EQ(pca.scores.cols(), 6);
    ASSERT_EQ(pca.loadings.rows(), 3);
    EXPECT_NEAR(pca.loadings(0, 0), 1.0, 1e-9);
    EXPECT_NEAR(pca.scores(0, 0), -5.0, 1e-9);
    EXPECT_NEAR(pca.variance(0), 14.0, 1e-9);
    EXPECT_GT(pca.variance(0), pca.variance(1));

    EXPECT_THROW(performPCA(Eigen::MatrixXd(0, 4), 2), ProcessingError);
}

TEST(ProjectionsTest, GeneratesEveryMethodAndReduction) {
    DataMatrix data = testdata::groupedExpression();
    AnalysisParameters params;
    params.pcaComponents = 10;

    ProjectionResult result = generateProjections(data, params);
    ASSERT_EQ(result.projections.size(), 4u);
    for (const auto& name : ProjectionMethodFactory::availableMethods(false)) {
        ASSERT_EQ(result.projections.count(name), 1u) << name;
        const Eigen::MatrixXd& coordinates = result.projections.at(name);
        EXPECT_EQ(coordinates.rows(), 30);
        EXPECT_EQ(coordinates.cols(), 2);
        EXPECT_TRUE(coordinates.allFinite());
        EXPECT_LE(coordinates.rowwise().norm().maxCoeff(), 1.0 + 1e-9);
    }

    EXPECT_EQ(result.reduced.kind, DataKind::PRINCIPAL_COMPONENTS);
    EXPECT_EQ(result.reduced.numGenes(), 10);
    EXPECT_EQ(result.reduced.sampleLabels, data.sampleLabels);
    EXPECT_EQ(result.reduced.geneNames.front(), "PC1");
    EXPECT_EQ(result.reduced.loadings.rows(), 50);
    EXPECT_EQ(result.reduced.loadings.cols(), 10);
}

TEST(ProjectionsTest, LeanRunsUseCheaperMethods) {
    AnalysisParameters params;
    params.lean = true;
    params.pcaComponents = 5;
    ProjectionResult result = generateProjections(testdata::groupedExpression(), params);
    EXPECT_EQ(result.projections.size(), 2u);
    EXPECT_EQ(result.projections.count("MDS"), 0u);
}

TEST(ProjectionsTest, InputProjectionsAreAlignedToSamples) {
    DataMatrix data = testdata::groupedExpression();
    AnalysisParameters params;
    params.lean = true;
    params.pcaComponents = 5;

    InputProjection custom;
    custom.coordinates = Eigen::MatrixXd::Zero(30, 2);
    for (int i = 0; i < 30; ++i) {
        int sample = 29 - i;
        custom.sampleLabels.push_back("S" + std::to_string(sample));
        custom.coordinates(i, 0) = sample;
    }
    InputProjections inputs = {{"Custom", custom}};

    ProjectionResult result = generateProjections(data, params, &inputs);
    ASSERT_EQ(result.projections.count("Custom"), 1u);
    EXPECT_NEAR(result.projections.at("Custom")(0, 0), -1.0, 1e-12);
    EXPECT_NEAR(result.projections.at("Custom")(29, 0), 1.0, 1e-12);

    custom.sampleLabels[0] = "unknown";
    inputs = {{"Custom", custom}};
    EXPECT_THROW(generateProjections(data, params, &inputs), ConsistencyError);

    custom.coordinates = Eigen::MatrixXd::Zero(30, 3);
    inputs = {{"Custom", custom}};
    EXPECT_THROW(generateProjections(data, params, &inputs), ConsistencyError);
}

TEST(ProjectionsTest, RejectsUnknownAndEmptyInput) {
    EXPECT_THROW(ProjectionMethodFactory::createMethod("tSNE"), ConfigurationError);
    AnalysisParameters params;
    EXPECT_THROW(generateProjections(DataMatrix(), params), ProcessingError);
}
