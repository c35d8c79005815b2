#ifndef SHARPGATE_IMAGE_UTILS_H
#define SHARPGATE_IMAGE_UTILS_H

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace sharpgate {

/**
 * @brief Converts an image to a single intensity channel.
 *
 * Accepts 1, 3 (BGR) or 4 (BGRA) channel images. A single channel 8U, 16U,
 * 16S, 32F or 64F input is returned without copying; other single channel
 * depths become 32F. Colour images that are not 8U, 16U or 32F are converted
 * to 32F before the colour conversion.
 *
 * @param image Decoded image, borrowed for the call
 * @return Single channel image
 * @throws InvalidArgument if the image is empty or has another channel count
 */
cv::Mat toGray(const cv::Mat& image);

/**
 * @brief Scale factor that brings the long edge of @p size down to @p maxLongEdge.
 *
 * @return 1.0 when @p maxLongEdge is 0 or the image already fits, otherwise a value in (0, 1)
 */
double longEdgeScale(const cv::Size& size, int maxLongEdge);

/**
 * @brief Downscales so that max(width, height) <= maxLongEdge, keeping the aspect ratio.
 *
 * Returns @p src itself (shared data) when no downscale is needed.
 *
 * @param src Image to resize
 * @param maxLongEdge Long edge limit, 0 disables resizing
 * @param interpolation cv::INTER_AREA for images, cv::INTER_NEAREST for masks
 */
cv::Mat resizeKeepingLongEdge(const cv::Mat& src, int maxLongEdge, int interpolation = cv::INTER_AREA);

/// Target size for resizeKeepingLongEdge(); never smaller than 1x1.
cv::Size longEdgeTargetSize(const cv::Size& size, int maxLongEdge);

} // namespace sharpgate

#endif // SHARPGATE_IMAGE_UTILS_H
