//
// logsum - Numerically stable log-space sums
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

#include "boost/test/unit_test.hpp"
#include "boost/iterator/transform_iterator.hpp"
#include "boost/math/special_functions/next.hpp"

#include "logSumUtil.hh"

#include <algorithm>
#include <cmath>
#include <limits>
#include <list>
#include <map>
#include <set>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>


BOOST_AUTO_TEST_SUITE( logSumUtilTestSuite )


/// require that two values are within a few units in the last place
template <typename FloatType>
static
void
requireUlpClose(
    const FloatType x1,
    const FloatType x2,
    const FloatType maxUlps = 4)
{
    BOOST_REQUIRE_LE(std::abs(boost::math::float_distance(x1, x2)), maxUlps);
}


template <typename FloatType>
static
FloatType
getNan()
{
    return std::numeric_limits<FloatType>::quiet_NaN();
}


static
void
twoTermLogSumTest(
    const double x1,
    const double x2)
{
    static const double eps(0.00001);

    const double expect(std::log(x1+x2));

    const double logx1(std::log(x1));
    const double logx2(std::log(x2));

    BOOST_REQUIRE_CLOSE(getLogSum(logx1, logx2), expect, eps);

    std::initializer_list<double> ilist = {logx1, logx2};
    BOOST_REQUIRE_CLOSE(getLogSumSequence(ilist), expect, eps);

    std::vector<double> vec = ilist;
    BOOST_REQUIRE_CLOSE(getLogSumSequence(vec), expect, eps);
    BOOST_REQUIRE_CLOSE(getLogSumSequence(std::begin(vec), std::end(vec)), expect, eps);
}


BOOST_AUTO_TEST_CASE( testGetLogSum2 )
{
    twoTermLogSumTest(0.5, 0.2);
    twoTermLogSumTest(0.00001, 0.00000001);
    twoTermLogSumTest(1, 1);
}


static
void
fourTermLogSumTest(
    const double x1,
    const double x2,
    const double x3,
    const double x4)
{
    static const double eps(0.00001);

    const double expect(std::log(x1+x2+x3+x4));

    std::vector<double> vec = {std::log(x1), std::log(x2), std::log(x3), std::log(x4)};
    BOOST_REQUIRE_CLOSE(getLogSumSequence(vec), expect, eps);
    BOOST_REQUIRE_CLOSE(getLogSum(getLogSum(vec[0], vec[1]), getLogSum(vec[2], vec[3])), expect, eps);
}


BOOST_AUTO_TEST_CASE( testGetLogSum4 )
{
    fourTermLogSumTest(0.5, 0.2, 0.01, 0.1);
    fourTermLogSumTest(0.00001, 0.00000001, 0.00000001, 0.00001);
    fourTermLogSumTest(1, 1, 1, 1);
}


BOOST_AUTO_TEST_CASE( testGetLogSumNoOverflow )
{
    // naive evaluation of either sum overflows to inf:
    BOOST_REQUIRE_EQUAL(getLogSum(1023., 511.), 1023.);
    BOOST_REQUIRE(std::isinf(std::log(std::exp(1023.) + std::exp(511.))));

    BOOST_REQUIRE_CLOSE(getLogSum(1000., 1000.), 1000. + std::log(2.), 0.00001);
    BOOST_REQUIRE_CLOSE(getLogSum(-1000., -1000.), -1000. + std::log(2.), 0.00001);
}


template <typename FloatType>
static
void
pairwiseSpecialValueTest()
{
    const FloatType inf(posInf<FloatType>());
    const FloatType x(0.5);

    BOOST_REQUIRE_EQUAL(getLogSum(inf, inf), inf);
    BOOST_REQUIRE_EQUAL(getLogSum(-inf, -inf), -inf);
    BOOST_REQUIRE_EQUAL(getLogSum(inf, -inf), inf);
    BOOST_REQUIRE_EQUAL(getLogSum(-inf, inf), inf);
    BOOST_REQUIRE_EQUAL(getLogSum(inf, x), inf);
    BOOST_REQUIRE_EQUAL(getLogSum(x, inf), inf);
    BOOST_REQUIRE_EQUAL(getLogSum(-inf, x), x);
    BOOST_REQUIRE_EQUAL(getLogSum(x, -inf), x);

    BOOST_REQUIRE(std::isnan(getLogSum(getNan<FloatType>(), inf)));
    BOOST_REQUIRE(std::isnan(getLogSum(getNan<FloatType>(), -inf)));
    BOOST_REQUIRE(std::isnan(getLogSum(inf, getNan<FloatType>())));
    BOOST_REQUIRE(std::isnan(getLogSum(-inf, getNan<FloatType>())));
    BOOST_REQUIRE(std::isnan(getLogSum(getNan<FloatType>(), x)));
    BOOST_REQUIRE(std::isnan(getLogSum(getNan<FloatType>(), -x)));
    BOOST_REQUIRE(std::isnan(getLogSum(x, getNan<FloatType>())));
    BOOST_REQUIRE(std::isnan(getLogSum(-x, getNan<FloatType>())));
    BOOST_REQUIRE(std::isnan(getLogSum(getNan<FloatType>(), getNan<FloatType>())));
}


BOOST_AUTO_TEST_CASE( testGetLogSumSpecialValues )
{
    pairwiseSpecialValueTest<float>();
    pairwiseSpecialValueTest<double>();
}


template <typename FloatType>
static
void
pairwiseAlgebraTest()
{
    const std::vector<FloatType> values = {-1000, -20.5, -1, -0.25, 0, 0.5, 1, 3.75, 88, 700};
    for (const FloatType a : values)
    {
        // adding a log-space zero is a no-op:
        BOOST_REQUIRE_EQUAL(getLogSum(a, negInf<FloatType>()), a);

        for (const FloatType b : values)
        {
            BOOST_REQUIRE_EQUAL(getLogSum(a, b), getLogSum(b, a));
            BOOST_REQUIRE_GE(getLogSum(a, b), std::max(a, b));
        }
    }

    const FloatType x(0.5);
    const FloatType y(1.0);
    requireUlpClose(getLogSum(x, y), static_cast<FloatType>(std::log(std::exp(x) + std::exp(y))));
}


BOOST_AUTO_TEST_CASE( testGetLogSumAlgebra )
{
    pairwiseAlgebraTest<float>();
    pairwiseAlgebraTest<double>();
}


template <typename FloatType>
static
void
sequenceSpecialValueTest()
{
    const FloatType inf(posInf<FloatType>());
    const FloatType x(0.5);
    const FloatType y(1.0);

    typedef std::vector<FloatType> vec_t;

    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{-inf, x, -inf, -inf}), x);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{-inf, -inf, -inf, x}), x);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{x, -inf, -inf, -inf}), x);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{x, -inf}), x);

    requireUlpClose(getLogSumSequence(vec_t{-inf, x, y, -inf}), y + std::log(std::exp(x - y) + 1));

    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{inf, x, y, -inf}), inf);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{x, inf, y, -inf}), inf);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{-inf, inf, x, y}), inf);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{-1000, 5, inf, -3}), inf);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t(4, inf)), inf);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{-inf, -inf, -inf, inf}), inf);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{inf, -inf, -inf, -inf}), inf);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{inf, inf, y, -inf}), inf);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{inf, -inf, -inf, inf}), inf);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{x, inf}), inf);

    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t(4, -inf)), -inf);

    // edge cases
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t()), -inf);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{-inf}), -inf);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{inf}), inf);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{x}), x);
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{0}), FloatType(0));
    BOOST_REQUIRE_EQUAL(getLogSumSequence(vec_t{-12345.5}), FloatType(-12345.5));
}


BOOST_AUTO_TEST_CASE( testGetLogSumSequenceSpecialValues )
{
    sequenceSpecialValueTest<float>();
    sequenceSpecialValueTest<double>();
}


template <typename FloatType>
static
void
sequenceNanTest()
{
    const FloatType inf(posInf<FloatType>());
    const FloatType nan(std::numeric_limits<FloatType>::quiet_NaN());
    const FloatType x(0.5);
    const FloatType y(1.0);

    const std::vector<std::vector<FloatType>> nanSequences =
    {
        {x, inf, nan, y},
        {nan, x, y, inf},
        {inf, inf, x, nan},
        {inf, inf, -inf, nan},
        {inf, inf, inf, nan},
        {-inf, -inf, -inf, nan},
        {-inf, -inf, inf, nan},
        {x, y, nan, inf},
        {x, y, nan},
        {x, nan, y},
        {nan, x, y},
        {nan},
        {nan, nan, nan, nan},
        {-inf, nan},
        {inf, nan},
        {-inf, inf, nan},
        {inf, -inf, nan}
    };

    for (const auto& seq : nanSequences)
    {
        BOOST_REQUIRE(std::isnan(getLogSumSequence(seq)));
        BOOST_REQUIRE(std::isnan(getLogSumSequence(std::begin(seq), std::end(seq))));
    }
}


BOOST_AUTO_TEST_CASE( testGetLogSumSequenceNan )
{
    sequenceNanTest<float>();
    sequenceNanTest<double>();
}


namespace
{

/// identity transform which counts how many values have been read
struct CountingIdentity
{
    typedef double result_type;

    explicit
    CountingIdentity(unsigned& readCount)
        : _readCount(readCount)
    {}

    double
    operator()(const double x) const
    {
        _readCount++;
        return x;
    }

private:
    unsigned& _readCount;
};

}


BOOST_AUTO_TEST_CASE( testGetLogSumSequenceNanStopsIteration )
{
    const std::vector<double> vec = {1.5, std::numeric_limits<double>::quiet_NaN(), 2.0, 3.0};

    unsigned readCount(0);
    const CountingIdentity ci(readCount);
    const double result(getLogSumSequence(
                            boost::make_transform_iterator(vec.begin(), ci),
                            boost::make_transform_iterator(vec.end(), ci)));

    BOOST_REQUIRE(std::isnan(result));
    BOOST_REQUIRE_EQUAL(readCount, 2u);
}


BOOST_AUTO_TEST_CASE( testGetLogSumSequenceLargeMagnitude )
{
    static const double eps(0.00001);

    BOOST_REQUIRE_CLOSE(getLogSumSequence({1000., 1000.}), 1000.693147, eps);
    BOOST_REQUIRE_CLOSE(getLogSumSequence({-1000., -1000.}), -999.306852, eps);
    BOOST_REQUIRE_CLOSE(getLogSumSequence({700., 710., 720.}), 720. + std::log(1. + std::exp(-10.) + std::exp(-20.)), eps);

    BOOST_REQUIRE_CLOSE(getLogSumSequence({88.f, 88.f, 88.f}), 88.f + std::log(3.f), 0.001f);
}


template <typename FloatType>
static
void
sequenceAssociativityTest(
    std::vector<FloatType> values)
{
    static const FloatType eps(std::is_same<FloatType,float>::value ? 0.0001 : 0.00000001);

    std::sort(values.begin(), values.end());
    do
    {
        const FloatType expect(getLogSum(getLogSum(values[0], values[1]), values[2]));
        BOOST_REQUIRE_CLOSE(getLogSumSequence(values), expect, eps);
    }
    while (std::next_permutation(values.begin(), values.end()));
}


BOOST_AUTO_TEST_CASE( testGetLogSumSequenceAssociativity )
{
    sequenceAssociativityTest<double>({0.5, -2., 3.25});
    sequenceAssociativityTest<double>({-700., 650., 649.5});
    sequenceAssociativityTest<double>({10., 10., 10.});
    sequenceAssociativityTest<float>({0.5f, -2.f, 3.25f});
    sequenceAssociativityTest<float>({-80.f, 60.f, 59.5f});
}


template <typename FloatType>
static
void
sequenceOrderTest()
{
    std::vector<FloatType> values = {-100, -3.25, 0.125, 1.5, 6.875, 7};
    const FloatType expect(getLogSumSequence(values));

    // includes every order where the max arrives last:
    std::sort(values.begin(), values.end());
    do
    {
        requireUlpClose(getLogSumSequence(values), expect, FloatType(16));
    }
    while (std::next_permutation(values.begin(), values.end()));
}


BOOST_AUTO_TEST_CASE( testGetLogSumSequenceOrderIndependence )
{
    sequenceOrderTest<float>();
    sequenceOrderTest<double>();
}


BOOST_AUTO_TEST_CASE( testGetLogSumSequenceContainers )
{
    static const double eps(0.00001);

    const std::vector<double> vec = {0.5, 1.0, 1.5};
    const double expect(getLogSumSequence(vec));

    const std::list<double> lst(vec.begin(), vec.end());
    BOOST_REQUIRE_EQUAL(getLogSumSequence(lst), expect);

    const std::set<double> st(vec.begin(), vec.end());
    BOOST_REQUIRE_EQUAL(getLogSumSequence(st), expect);

    const double arr[] = {0.5, 1.0, 1.5};
    BOOST_REQUIRE_EQUAL(getLogSumSequence(arr), expect);

    std::istringstream iss("0.5 1.0 1.5");
    BOOST_REQUIRE_EQUAL(getLogSumSequence(std::istream_iterator<double>(iss), std::istream_iterator<double>()), expect);

    std::vector<double> logVec;
    std::transform(vec.begin(), vec.end(), std::back_inserter(logVec), [](double v) { return std::log(v); });
    BOOST_REQUIRE_CLOSE(getLogSumSequence(logVec), std::log(3.), eps);

    const std::map<int,double> valueMap = {{1, 0.5}, {2, 1.0}, {3, 1.5}};
    std::vector<float> mapLogs;
    for (const auto& val : valueMap)
    {
        mapLogs.push_back(std::log(static_cast<float>(val.second)));
    }
    BOOST_REQUIRE_CLOSE(getLogSumSequence(mapLogs), std::log(3.f), 0.001f);
}


BOOST_AUTO_TEST_CASE( testGetLogSumSequenceOfLogIntegers )
{
    // log(0)+log(1)+...+log(9) sums to log(45), log(0) is -inf:
    std::vector<double> logInts;
    for (int i(0); i<10; ++i)
    {
        logInts.push_back(std::log(static_cast<double>(i)));
    }
    requireUlpClose(getLogSumSequence(logInts), std::log(45.));
}


BOOST_AUTO_TEST_CASE( testGetLogMeanSequence )
{
    static const double eps(0.00001);

    const std::vector<double> vals = {0.1, 0.2, 0.3, 0.4, 0.5};
    std::vector<double> logVals;
    for (const double val : vals) logVals.push_back(std::log(val));

    BOOST_REQUIRE_CLOSE(std::exp(getLogMeanSequence(logVals)), 0.3, eps);
    BOOST_REQUIRE_CLOSE(getLogMeanSequence(std::begin(logVals), std::end(logVals)), std::log(0.3), eps);

    const std::vector<double> single = {-4.25};
    BOOST_REQUIRE_EQUAL(getLogMeanSequence(single), -4.25);

    const double inf(std::numeric_limits<double>::infinity());
    const std::vector<double> withInf = {1., inf};
    BOOST_REQUIRE_EQUAL(getLogMeanSequence(withInf), inf);

    const std::vector<double> allNegInf = {-inf, -inf};
    BOOST_REQUIRE_EQUAL(getLogMeanSequence(allNegInf), -inf);

    const std::vector<double> withNan = {1., std::numeric_limits<double>::quiet_NaN()};
    BOOST_REQUIRE(std::isnan(getLogMeanSequence(withNan)));
}


BOOST_AUTO_TEST_CASE( testGetLogMeanSequenceEmpty )
{
    const std::vector<float> empty;
    BOOST_REQUIRE_THROW(getLogMeanSequence(empty), logsum::common::PreConditionException);
}


BOOST_AUTO_TEST_SUITE_END()
