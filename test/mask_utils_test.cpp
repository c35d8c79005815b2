#include "mask_utils.hpp"
#include "image_utils.hpp"
#include "errors.hpp"
#include "gtest/gtest.h"

using namespace sharpgate;

/**
 * @brief Values above 127 become 255, everything else 0
 */
TEST(MaskUtilsTest, BinarizeThreshold) {
    cv::Mat m = (cv::Mat_<uchar>(1, 5) << 0, 1, 127, 128, 255);
    cv::Mat b = binarizeMask(m);
    ASSERT_EQ(CV_8UC1, b.type());
    EXPECT_EQ(0, b.at<uchar>(0, 0));
    EXPECT_EQ(0, b.at<uchar>(0, 1));
    EXPECT_EQ(0, b.at<uchar>(0, 2));
    EXPECT_EQ(255, b.at<uchar>(0, 3));
    EXPECT_EQ(255, b.at<uchar>(0, 4));
}

/**
 * @brief Colour masks are reduced to one channel before thresholding
 */
TEST(MaskUtilsTest, BinarizeColourMask) {
    cv::Mat m(4, 4, CV_8UC3, cv::Scalar(255, 255, 255));
    m(cv::Rect(0, 0, 2, 4)).setTo(cv::Scalar(0, 0, 0));
    cv::Mat b = binarizeMask(m);
    ASSERT_EQ(CV_8UC1, b.type());
    EXPECT_EQ(8, cv::countNonZero(b));
}

/**
 * @brief An absent mask becomes an all-on mask of the image size
 */
TEST(MaskUtilsTest, AlignEmptyMaskIsAllOn) {
    cv::Mat m = alignMask(cv::Mat(), cv::Size(7, 5));
    ASSERT_EQ(cv::Size(7, 5), m.size());
    EXPECT_EQ(35, cv::countNonZero(m));
}

/**
 * @brief A mask is only resized when its aspect ratio matches the image
 */
TEST(MaskUtilsTest, AlignRejectsOtherAspectRatio) {
    cv::Mat m(10, 10, CV_8UC1, cv::Scalar(255));
    EXPECT_THROW(alignMask(m, cv::Size(20, 10)), InvalidArgument);
    EXPECT_NO_THROW(alignMask(m, cv::Size(30, 30)));
}

/**
 * @brief Coverage is the fraction of on pixels, 0 for an absent mask
 */
TEST(MaskUtilsTest, Coverage) {
    cv::Mat m = cv::Mat::zeros(10, 10, CV_8UC1);
    EXPECT_DOUBLE_EQ(0.0, maskCoverage(m));
    m(cv::Rect(0, 0, 5, 10)).setTo(255);
    EXPECT_DOUBLE_EQ(0.5, maskCoverage(m));
    EXPECT_DOUBLE_EQ(0.0, maskCoverage(cv::Mat()));
}

/**
 * @brief Radius 1 grows a single pixel into a 3x3 block
 */
TEST(MaskUtilsTest, Dilation) {
    cv::Mat m = cv::Mat::zeros(9, 9, CV_8UC1);
    m.at<uchar>(4, 4) = 255;
    EXPECT_EQ(9, cv::countNonZero(dilateMask(m, 1)));
    EXPECT_EQ(25, cv::countNonZero(dilateMask(m, 2)));
    EXPECT_EQ(1, cv::countNonZero(dilateMask(m, 0)));
    EXPECT_THROW(dilateMask(m, -1), InvalidArgument);
}

/**
 * @brief The long edge is brought down to the limit with the aspect ratio kept
 */
TEST(ImageUtilsTest, LongEdgeTargetSize) {
    EXPECT_EQ(cv::Size(50, 25), longEdgeTargetSize(cv::Size(200, 100), 50));
    EXPECT_EQ(cv::Size(25, 50), longEdgeTargetSize(cv::Size(100, 200), 50));
    EXPECT_EQ(cv::Size(200, 100), longEdgeTargetSize(cv::Size(200, 100), 0));
    EXPECT_EQ(cv::Size(200, 100), longEdgeTargetSize(cv::Size(200, 100), 200));
    EXPECT_DOUBLE_EQ(0.25, longEdgeScale(cv::Size(200, 100), 50));
}

/**
 * @brief Images already within bounds are returned without a copy
 */
TEST(ImageUtilsTest, ResizeWithinBoundsSharesData) {
    cv::Mat img(30, 40, CV_8UC1, cv::Scalar(7));
    cv::Mat same = resizeKeepingLongEdge(img, 40);
    EXPECT_EQ(img.data, same.data);

    cv::Mat smaller = resizeKeepingLongEdge(img, 20);
    EXPECT_EQ(cv::Size(20, 15), smaller.size());
    EXPECT_EQ(7, smaller.at<uchar>(5, 5));
}

/**
 * @brief Empty images and unsupported channel counts are rejected
 */
TEST(ImageUtilsTest, ToGrayRejectsBadInput) {
    EXPECT_THROW(toGray(cv::Mat()), InvalidArgument);
    EXPECT_THROW(toGray(cv::Mat(3, 3, CV_8UC2)), InvalidArgument);
}

/**
 * @brief Single channel depths the filters accept are kept, others become 32F
 *
 * Colour images of a depth cvtColor cannot take are converted to 32F first.
 */
TEST(ImageUtilsTest, ToGrayDepths) {
    cv::Mat doubles(3, 3, CV_64FC1, cv::Scalar(2.5));
    cv::Mat gray = toGray(doubles);
    EXPECT_EQ(CV_64FC1, gray.type());
    EXPECT_EQ(doubles.data, gray.data);

    cv::Mat shorts(3, 3, CV_16SC1, cv::Scalar(-40));
    EXPECT_EQ(CV_16SC1, toGray(shorts).type());

    cv::Mat ints(3, 3, CV_32SC1, cv::Scalar(7));
    cv::Mat fromInts = toGray(ints);
    EXPECT_EQ(CV_32FC1, fromInts.type());
    EXPECT_FLOAT_EQ(7.0f, fromInts.at<float>(1, 1));

    cv::Mat colourDoubles(3, 3, CV_64FC3, cv::Scalar(0.5, 0.5, 0.5));
    cv::Mat fromColour = toGray(colourDoubles);
    EXPECT_EQ(CV_32FC1, fromColour.type());
    EXPECT_NEAR(0.5, fromColour.at<float>(1, 1), 1e-5);
}

/**
 * @brief A probability pixel is on from the cutoff upwards, inclusive
 */
TEST(MaskUtilsTest, ProbabilityCutoffBoundary) {
    cv::Mat prob = (cv::Mat_<float>(1, 6) << 0.0f, 0.049f, 0.05f, 0.051f, 0.9f, 1.0f);
    cv::Mat m = maskFromProbability(prob, 0.05);
    ASSERT_EQ(CV_8UC1, m.type());
    ASSERT_EQ(prob.size(), m.size());
    EXPECT_EQ(0, m.at<uchar>(0, 0));
    EXPECT_EQ(0, m.at<uchar>(0, 1));
    EXPECT_EQ(255, m.at<uchar>(0, 2));
    EXPECT_EQ(255, m.at<uchar>(0, 3));
    EXPECT_EQ(255, m.at<uchar>(0, 4));
    EXPECT_EQ(255, m.at<uchar>(0, 5));
}

/**
 * @brief Out of range probabilities are clamped before thresholding
 */
TEST(MaskUtilsTest, ProbabilityIsClamped) {
    cv::Mat prob = (cv::Mat_<float>(1, 3) << -3.0f, 0.5f, 7.0f);
    cv::Mat atOne = maskFromProbability(prob, 1.0);
    EXPECT_EQ(0, atOne.at<uchar>(0, 0));
    EXPECT_EQ(0, atOne.at<uchar>(0, 1));
    EXPECT_EQ(255, atOne.at<uchar>(0, 2));

    cv::Mat atZero = maskFromProbability(prob, 0.0);
    EXPECT_EQ(3, cv::countNonZero(atZero));
}

/**
 * @brief Coverage of the thresholded map follows the cutoff
 */
TEST(MaskUtilsTest, ProbabilityCoverage) {
    // Left quarter at 0.02, next quarter at 0.3, right half at 0.8
    cv::Mat prob(20, 40, CV_32FC1, cv::Scalar(0.8));
    prob(cv::Rect(0, 0, 10, 20)).setTo(0.02);
    prob(cv::Rect(10, 0, 10, 20)).setTo(0.3);

    EXPECT_DOUBLE_EQ(0.75, maskCoverage(maskFromProbability(prob, 0.05)));
    EXPECT_DOUBLE_EQ(0.5, maskCoverage(maskFromProbability(prob, 0.5)));
    EXPECT_DOUBLE_EQ(0.0, maskCoverage(maskFromProbability(prob, 0.95)));
}

/**
 * @brief Empty or multi-channel maps and cutoffs outside [0, 1] are rejected
 */
TEST(MaskUtilsTest, ProbabilityRejectsBadInput) {
    EXPECT_THROW(maskFromProbability(cv::Mat(), 0.05), InvalidArgument);
    EXPECT_THROW(maskFromProbability(cv::Mat(4, 4, CV_32FC3, cv::Scalar::all(0.5)), 0.05), InvalidArgument);
    cv::Mat prob(4, 4, CV_32FC1, cv::Scalar(0.5));
    EXPECT_THROW(maskFromProbability(prob, -0.1), InvalidArgument);
    EXPECT_THROW(maskFromProbability(prob, 1.5), InvalidArgument);
}
