#include "sharpness_evaluator.hpp"
#include "errors.hpp"
#include "image_utils.hpp"
#include "logfile.hpp"
#include "mask_utils.hpp"

#include <opencv2/imgproc.hpp>

namespace sharpgate {

namespace {

void checkKernelSize(int kernelSize) {
    if (kernelSize != 1 && kernelSize != 3 && kernelSize != 5) {
        logger->error("[SharpnessEvaluator] Unsupported Sobel kernel size {}", kernelSize);
        throw InvalidArgument("kernel size must be 1, 3 or 5, got " + std::to_string(kernelSize));
    }
}

cv::Mat wrapGray(const unsigned char* data, int width, int height) {
    if (!data || width <= 0 || height <= 0) {
        logger->error("[SharpnessEvaluator] Invalid raw buffer {}x{}", width, height);
        throw InvalidArgument("raw image buffer is null or has no pixels");
    }
    // Non-owning header; the caller keeps the buffer alive for the call
    return cv::Mat(height, width, CV_8UC1, const_cast<unsigned char*>(data));
}

} // namespace

double tenengrad(const cv::Mat& image, const cv::Mat& mask, int kernelSize, int maxLongEdge) {
    checkKernelSize(kernelSize);
    if (maxLongEdge < 0) {
        logger->error("[SharpnessEvaluator] Negative max long edge {}", maxLongEdge);
        throw InvalidArgument("maxLongEdge must be non-negative");
    }

    cv::Mat gray = toGray(image);
    cv::Mat fullMask = alignMask(mask, gray.size());

    // Shared downscale: area for the image, nearest for the mask so it stays binary
    const double scale = longEdgeScale(gray.size(), maxLongEdge);
    cv::Mat resized = resizeKeepingLongEdge(gray, maxLongEdge, cv::INTER_AREA);
    cv::Mat m = resizeKeepingLongEdge(fullMask, maxLongEdge, cv::INTER_NEAREST);

    const int onPixels = cv::countNonZero(m);
    if (onPixels == 0) {
        logger->debug("[SharpnessEvaluator] tenengrad: empty mask, returning 0");
        return 0.0;
    }

    cv::Mat gx, gy;
    cv::Sobel(resized, gx, CV_64F, 1, 0, kernelSize);
    cv::Sobel(resized, gy, CV_64F, 0, 1, kernelSize);

    cv::Mat mag2 = gx.mul(gx) + gy.mul(gy);
    double score = cv::mean(mag2, m)[0] * scale * scale;

    logger->debug("[SharpnessEvaluator] tenengrad={} size={}x{} k={} pixels={}",
                  score, resized.cols, resized.rows, kernelSize, onPixels);
    return score;
}

double laplacianVariance(const cv::Mat& image, const cv::Mat& mask) {
    cv::Mat gray = toGray(image);
    if (!mask.empty() && mask.size() != gray.size()) {
        logger->error("[SharpnessEvaluator] laplacianVariance: mask {}x{} does not match image {}x{}",
                      mask.cols, mask.rows, gray.cols, gray.rows);
        throw InvalidArgument("mask size does not match image size");
    }
    cv::Mat m = mask.empty() ? alignMask(mask, gray.size()) : binarizeMask(mask);

    const int onPixels = cv::countNonZero(m);
    if (onPixels < 2) {
        logger->debug("[SharpnessEvaluator] laplacianVariance: {} pixel(s) in mask, returning 0", onPixels);
        return 0.0;
    }

    cv::Mat lap;
    cv::Laplacian(gray, lap, CV_64F, 3);

    cv::Scalar mean, stddev;
    cv::meanStdDev(lap, mean, stddev, m);
    double score = stddev[0] * stddev[0];

    logger->debug("[SharpnessEvaluator] laplacianVariance={} size={}x{} pixels={}",
                  score, gray.cols, gray.rows, onPixels);
    return score;
}

double tenengrad(const unsigned char* data, int width, int height,
                 const unsigned char* maskData, int kernelSize, int maxLongEdge) {
    cv::Mat image = wrapGray(data, width, height);
    cv::Mat mask;
    if (maskData) {
        mask = wrapGray(maskData, width, height);
    }
    return tenengrad(image, mask, kernelSize, maxLongEdge);
}

double laplacianVariance(const unsigned char* data, int width, int height,
                         const unsigned char* maskData) {
    cv::Mat image = wrapGray(data, width, height);
    cv::Mat mask;
    if (maskData) {
        mask = wrapGray(maskData, width, height);
    }
    return laplacianVariance(image, mask);
}

} // namespace sharpgate
