#include <gtest/gtest.h>
#include "infoest/binning/histogram.hpp"
#include "infoest/core/errors.hpp"
#include <vector>

using namespace infoest::binning;
using infoest::core::DimensionMismatch;
using infoest::core::InvalidArgument;
using infoest::core::NormalizationError;

TEST(HistogramDD, EqualWidthBins1D) {
    Eigen::MatrixXd data(4, 1);
    data << 0.0, 1.0, 2.0, 3.0;

    auto hist = histogram_dd(data, {BinAxis{2}});
    ASSERT_EQ(hist.dims(), 1);
    ASSERT_EQ(hist.shape[0], 2);
    EXPECT_DOUBLE_EQ(hist.edges[0](0), 0.0);
    EXPECT_DOUBLE_EQ(hist.edges[0](1), 1.5);
    EXPECT_DOUBLE_EQ(hist.edges[0](2), 3.0);
    EXPECT_DOUBLE_EQ(hist.counts(0), 2.0);
    EXPECT_DOUBLE_EQ(hist.counts(1), 2.0);
    EXPECT_DOUBLE_EQ(hist.probabilities(0), 0.5);
}

TEST(HistogramDD, LastBinIncludesRightEdge) {
    Eigen::MatrixXd data(3, 1);
    data << 0.0, 0.5, 1.0;

    auto hist = histogram_dd(data, {BinAxis{std::vector<double>{0.0, 0.5, 1.0}}});
    EXPECT_DOUBLE_EQ(hist.counts(0), 1.0);
    EXPECT_DOUBLE_EQ(hist.counts(1), 2.0);
}

TEST(HistogramDD, RowMajorFlattening2D) {
    Eigen::MatrixXd data(4, 2);
    data << 0, 0,
            0, 1,
            1, 1,
            1, 1;
    const std::vector<double> edges = {-0.5, 0.5, 1.5};

    auto hist = histogram_dd(data, {BinAxis{edges}, BinAxis{edges}});
    ASSERT_EQ(hist.counts.size(), 4);
    EXPECT_EQ(hist.flat_index({1, 0}), 2);
    EXPECT_DOUBLE_EQ(hist.counts(0), 1.0);   // (0, 0)
    EXPECT_DOUBLE_EQ(hist.counts(1), 1.0);   // (0, 1)
    EXPECT_DOUBLE_EQ(hist.counts(2), 0.0);   // (1, 0)
    EXPECT_DOUBLE_EQ(hist.counts(3), 2.0);   // (1, 1)
}

TEST(HistogramDD, ConstantColumnGetsUnitRange) {
    Eigen::MatrixXd data = Eigen::MatrixXd::Constant(5, 1, 3.0);

    auto hist = histogram_dd(data, uniform_bins(4, 1));
    EXPECT_DOUBLE_EQ(hist.edges[0](0), 2.5);
    EXPECT_DOUBLE_EQ(hist.edges[0](4), 3.5);
    EXPECT_DOUBLE_EQ(hist.probabilities.sum(), 1.0);
    EXPECT_DOUBLE_EQ(hist.probabilities.maxCoeff(), 1.0);
}

TEST(HistogramDD, InvalidAxesThrow) {
    Eigen::MatrixXd data(3, 1);
    data << 0.0, 1.0, 2.0;

    EXPECT_THROW(histogram_dd(data, {BinAxis{0}}), InvalidArgument);
    EXPECT_THROW(histogram_dd(data, {BinAxis{std::vector<double>{1.0}}}), InvalidArgument);
    EXPECT_THROW(histogram_dd(data, {BinAxis{std::vector<double>{0.0, 2.0, 1.0}}}), InvalidArgument);
}

TEST(SymbolsToProb, SumsToOne) {
    Eigen::MatrixXd data(6, 2);
    data << 0.1, 5.0,
            0.4, 5.5,
            0.9, 6.0,
            0.2, 7.0,
            0.7, 9.0,
            0.3, 9.5;

    Eigen::VectorXd prob = symbols_to_prob(data, {BinAxis{3}, BinAxis{2}});
    ASSERT_EQ(prob.size(), 6);
    EXPECT_NEAR(prob.sum(), 1.0, 1e-12);
    EXPECT_GE(prob.minCoeff(), 0.0);
}

TEST(SymbolsToProb, DimensionMismatchThrows) {
    Eigen::MatrixXd data = Eigen::MatrixXd::Random(100, 2);
    EXPECT_THROW(symbols_to_prob(data, {BinAxis{4}}), DimensionMismatch);
}

TEST(SymbolsToProb, SamplesOutsideEdgesAreDropped) {
    Eigen::VectorXd data(4);
    data << -10.0, 0.25, 0.75, 10.0;

    Eigen::VectorXd prob = symbols_to_prob(data, {BinAxis{std::vector<double>{0.0, 0.5, 1.0}}});
    EXPECT_DOUBLE_EQ(prob(0), 0.5);
    EXPECT_DOUBLE_EQ(prob(1), 0.5);
}

TEST(SymbolsToProb, NoSampleInsideEdgesThrows) {
    Eigen::VectorXd data(3);
    data << 5.0, 6.0, 7.0;
    EXPECT_THROW(symbols_to_prob(data, {BinAxis{std::vector<double>{0.0, 1.0}}}),
                 NormalizationError);
}
