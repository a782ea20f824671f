#include <gtest/gtest.h>
#include "infoest/binning/combine_symbols.hpp"
#include "infoest/binning/histogram.hpp"
#include "infoest/core/errors.hpp"
#include "infoest/estimators/entropy.hpp"
#include <vector>

using namespace infoest::binning;

TEST(CombineSymbols, DistinctTuplesGetDistinctCodes) {
    Eigen::MatrixXd a(4, 1), b(4, 1);
    a << 0, 0, 1, 1;
    b << 0, 1, 0, 1;

    Eigen::MatrixXd joint = combine_symbols({a, b});
    ASSERT_EQ(joint.rows(), 4);
    ASSERT_EQ(joint.cols(), 1);
    EXPECT_DOUBLE_EQ(joint(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(joint(1, 0), 1.0);
    EXPECT_DOUBLE_EQ(joint(2, 0), 2.0);
    EXPECT_DOUBLE_EQ(joint(3, 0), 3.0);
}

TEST(CombineSymbols, RepeatedTuplesShareACode) {
    Eigen::MatrixXd a(5, 1), b(5, 1);
    a << 1, 1, 2, 2, 1;
    b << 5, 5, 7, 7, 5;

    Eigen::MatrixXd joint = combine_symbols({a, b});
    EXPECT_DOUBLE_EQ(joint(0, 0), joint(1, 0));
    EXPECT_DOUBLE_EQ(joint(0, 0), joint(4, 0));
    EXPECT_DOUBLE_EQ(joint(2, 0), joint(3, 0));
    EXPECT_NE(joint(0, 0), joint(2, 0));
}

TEST(CombineSymbols, MultiColumnSource) {
    Eigen::MatrixXd a(3, 2);
    a << 0, 1,
         0, 1,
         1, 0;

    Eigen::MatrixXd joint = combine_symbols({a});
    EXPECT_DOUBLE_EQ(joint(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(joint(1, 0), 0.0);
    EXPECT_DOUBLE_EQ(joint(2, 0), 1.0);
}

TEST(CombineSymbols, RowMismatchThrows) {
    Eigen::MatrixXd a = Eigen::MatrixXd::Zero(4, 1);
    Eigen::MatrixXd b = Eigen::MatrixXd::Zero(3, 1);
    EXPECT_THROW(combine_symbols({a, b}), infoest::core::DimensionMismatch);
    EXPECT_THROW(combine_symbols({}), infoest::core::InvalidArgument);
}

TEST(SymbolBins, OneBinPerCode) {
    Eigen::MatrixXd codes(4, 1);
    codes << 0, 3, 1, 2;

    BinSpec bins = symbol_bins(codes);
    ASSERT_EQ(bins.size(), 1u);
    const auto& edges = std::get<std::vector<double>>(bins[0]);
    ASSERT_EQ(edges.size(), 5u);
    EXPECT_DOUBLE_EQ(edges.front(), -0.5);
    EXPECT_DOUBLE_EQ(edges.back(), 3.5);

    Eigen::VectorXd prob = symbols_to_prob(codes, bins);
    EXPECT_TRUE(prob.isApprox(Eigen::VectorXd::Constant(4, 0.25)));
}

TEST(SymbolBins, JointSymbolEntropy) {
    Eigen::MatrixXd a(8, 1), b(8, 1);
    a << 0, 0, 1, 1, 0, 0, 1, 1;
    b << 0, 1, 0, 1, 0, 1, 0, 1;

    Eigen::MatrixXd joint = combine_symbols({a, b});
    double h = infoest::estimators::entropy_from_samples(
        joint, infoest::estimators::Method::Bin, symbol_bins(joint));
    EXPECT_NEAR(h, 2.0, 1e-12);
}

TEST(SymbolBins, NonIntegerOrHugeCodesThrow) {
    Eigen::MatrixXd codes(2, 1);
    codes << 0.5, 1.0;
    EXPECT_THROW(symbol_bins(codes), infoest::core::InvalidArgument);

    codes << 0.0, 1e300;
    EXPECT_THROW(symbol_bins(codes), infoest::core::InvalidArgument);
}

TEST(SymbolBins, SparseLargeCodesStayCompact) {
    Eigen::MatrixXd codes(4, 1);
    codes << 0.0, 1e12, 1e12, -7.0;

    BinSpec bins = symbol_bins(codes);
    const auto& edges = std::get<std::vector<double>>(bins[0]);
    EXPECT_EQ(edges.size(), 6u);   // three separated codes, two edges each

    Eigen::VectorXd prob = symbols_to_prob(codes, bins);
    EXPECT_NEAR(prob.maxCoeff(), 0.5, 1e-12);
    EXPECT_NEAR(infoest::estimators::discrete_entropy(prob), 1.5, 1e-12);
}
