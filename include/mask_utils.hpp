#ifndef SHARPGATE_MASK_UTILS_H
#define SHARPGATE_MASK_UTILS_H

#include <opencv2/core.hpp>

namespace sharpgate {

/// Mask pixels strictly above this value are "on" (>= 128 on a 0..255 scale).
constexpr double kMaskOnThreshold = 127.0;

/// Relative aspect-ratio difference up to which a mask is resized instead of rejected.
constexpr double kMaskAspectTolerance = 0.01;

/**
 * @brief Reduces a mask to a strict 0/255 CV_8UC1 image.
 *
 * Multi-channel masks are converted to gray first; non 8-bit masks are
 * saturated to 8-bit before thresholding.
 */
cv::Mat binarizeMask(const cv::Mat& mask);

/**
 * @brief Thresholds a segmentation probability map into a 0/255 CV_8UC1 mask.
 *
 * Values are clamped to [0, 1]; a pixel is on where probability >= @p cutoff.
 *
 * @param probability Single channel map of any depth
 * @param cutoff Probability cutoff in [0, 1]
 * @throws InvalidArgument for an empty or multi-channel map or a cutoff outside [0, 1]
 */
cv::Mat maskFromProbability(const cv::Mat& probability, double cutoff);

/**
 * @brief Brings a mask to the size of the image it applies to.
 *
 * An empty mask becomes an all-on mask. A mask with the same aspect ratio as
 * the image is resized with nearest-neighbour so it stays binary.
 *
 * @param mask Optional mask, empty when absent
 * @param imageSize Size of the (grayscale) image
 * @return Binary CV_8UC1 mask of @p imageSize
 * @throws InvalidArgument if the mask cannot be proportionally resized
 */
cv::Mat alignMask(const cv::Mat& mask, const cv::Size& imageSize);

/// Fraction of on pixels in [0, 1]; 0 for an empty mask.
double maskCoverage(const cv::Mat& mask);

/**
 * @brief Binary dilation with a (2 * radius + 1) square element, edges replicated.
 *
 * @throws InvalidArgument for a negative radius
 */
cv::Mat dilateMask(const cv::Mat& mask, int radius);

} // namespace sharpgate

#endif // SHARPGATE_MASK_UTILS_H
