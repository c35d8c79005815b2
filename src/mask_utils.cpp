#include "mask_utils.hpp"
#include "errors.hpp"
#include "image_utils.hpp"
#include "logfile.hpp"

#include <opencv2/imgproc.hpp>
#include <cmath>

namespace sharpgate {

cv::Mat binarizeMask(const cv::Mat& mask) {
    cv::Mat gray = toGray(mask);
    if (gray.depth() != CV_8U) {
        cv::Mat converted;
        gray.convertTo(converted, CV_8U);
        gray = converted;
    }
    cv::Mat binary;
    cv::threshold(gray, binary, kMaskOnThreshold, 255, cv::THRESH_BINARY);
    return binary;
}

cv::Mat maskFromProbability(const cv::Mat& probability, double cutoff) {
    if (probability.empty() || probability.channels() != 1) {
        logger->error("[MaskUtils] Probability map must be a non-empty single channel image");
        throw InvalidArgument("probability map must be a non-empty single channel image");
    }
    if (cutoff < 0.0 || cutoff > 1.0) {
        logger->error("[MaskUtils] Probability cutoff {} outside [0, 1]", cutoff);
        throw InvalidArgument("probability cutoff must be in [0, 1]");
    }

    cv::Mat prob;
    probability.convertTo(prob, CV_64F);
    cv::Mat lower = cv::max(prob, 0.0);
    cv::Mat clamped = cv::min(lower, 1.0);

    cv::Mat mask;
    cv::compare(clamped, cv::Scalar(cutoff), mask, cv::CMP_GE);
    return mask;
}

cv::Mat alignMask(const cv::Mat& mask, const cv::Size& imageSize) {
    if (imageSize.width <= 0 || imageSize.height <= 0) {
        logger->error("[MaskUtils] Cannot align a mask with an empty image");
        throw InvalidArgument("image is empty");
    }
    if (mask.empty()) {
        return cv::Mat(imageSize, CV_8UC1, cv::Scalar(255));
    }

    cv::Mat binary = binarizeMask(mask);
    if (binary.size() == imageSize) {
        return binary;
    }

    const double imageAspect = static_cast<double>(imageSize.width) / imageSize.height;
    const double maskAspect = static_cast<double>(binary.cols) / binary.rows;
    if (std::abs(maskAspect - imageAspect) > kMaskAspectTolerance * imageAspect) {
        logger->error("[MaskUtils] Mask {}x{} cannot be aligned with image {}x{}",
                      binary.cols, binary.rows, imageSize.width, imageSize.height);
        throw InvalidArgument("mask size does not match image size");
    }

    cv::Mat resized;
    cv::resize(binary, resized, imageSize, 0, 0, cv::INTER_NEAREST);
    return resized;
}

double maskCoverage(const cv::Mat& mask) {
    if (mask.empty()) {
        return 0.0;
    }
    cv::Mat binary = binarizeMask(mask);
    return static_cast<double>(cv::countNonZero(binary)) / static_cast<double>(binary.total());
}

cv::Mat dilateMask(const cv::Mat& mask, int radius) {
    if (radius < 0) {
        logger->error("[MaskUtils] Negative dilation radius {}", radius);
        throw InvalidArgument("dilation radius must be non-negative");
    }
    cv::Mat binary = binarizeMask(mask);
    if (radius == 0) {
        return binary;
    }
    const int dia = 2 * radius + 1;
    cv::Mat element = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(dia, dia));
    cv::Mat dilated;
    cv::dilate(binary, dilated, element, cv::Point(-1, -1), 1, cv::BORDER_REPLICATE);
    return dilated;
}

} // namespace sharpgate
