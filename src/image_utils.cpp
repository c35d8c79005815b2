#include "image_utils.hpp"
#include "errors.hpp"
#include "logfile.hpp"

#include <algorithm>
#include <cmath>

namespace sharpgate {

cv::Mat toGray(const cv::Mat& image) {
    if (image.empty()) {
        logger->error("[ImageUtils] Empty image");
        throw InvalidArgument("image is empty");
    }

    // Sobel and Laplacian also take 16S and 64F, cvtColor only 8U, 16U and 32F
    cv::Mat src = image;
    const int depth = image.depth();
    const bool filterDepth = depth == CV_8U || depth == CV_16U || depth == CV_16S ||
                             depth == CV_32F || depth == CV_64F;
    const bool colourDepth = depth == CV_8U || depth == CV_16U || depth == CV_32F;
    if (image.channels() == 1 ? !filterDepth : !colourDepth) {
        image.convertTo(src, CV_32F);
    }

    cv::Mat gray;
    switch (src.channels()) {
    case 1:
        gray = src;
        break;
    case 3:
        cv::cvtColor(src, gray, cv::COLOR_BGR2GRAY);
        break;
    case 4:
        cv::cvtColor(src, gray, cv::COLOR_BGRA2GRAY);
        break;
    default:
        logger->error("[ImageUtils] Unsupported channel count: {}", src.channels());
        throw InvalidArgument("image must have 1, 3 or 4 channels, got " + std::to_string(src.channels()));
    }
    return gray;
}

double longEdgeScale(const cv::Size& size, int maxLongEdge) {
    if (maxLongEdge <= 0) {
        return 1.0;
    }
    const int longEdge = std::max(size.width, size.height);
    if (longEdge <= maxLongEdge) {
        return 1.0;
    }
    return static_cast<double>(maxLongEdge) / static_cast<double>(longEdge);
}

cv::Size longEdgeTargetSize(const cv::Size& size, int maxLongEdge) {
    const double scale = longEdgeScale(size, maxLongEdge);
    if (scale >= 1.0) {
        return size;
    }
    const int w = std::max(1, static_cast<int>(std::round(size.width * scale)));
    const int h = std::max(1, static_cast<int>(std::round(size.height * scale)));
    return cv::Size(w, h);
}

cv::Mat resizeKeepingLongEdge(const cv::Mat& src, int maxLongEdge, int interpolation) {
    const cv::Size target = longEdgeTargetSize(src.size(), maxLongEdge);
    if (target == src.size()) {
        return src;
    }
    cv::Mat dst;
    cv::resize(src, dst, target, 0, 0, interpolation);
    return dst;
}

} // namespace sharpgate
