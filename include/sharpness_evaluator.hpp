#ifndef SHARPGATE_SHARPNESS_EVALUATOR_H
#define SHARPGATE_SHARPNESS_EVALUATOR_H

#include <opencv2/core.hpp>

namespace sharpgate {

/**
 * @brief Tenengrad sharpness: mean of Gx² + Gy² (Sobel) over the masked pixels.
 *
 * The image is converted to gray and, if @p maxLongEdge is positive and the
 * image is larger, area-downscaled so its long edge equals @p maxLongEdge.
 * The mask follows with nearest-neighbour. After a downscale by factor s the
 * result is multiplied by s², so gradients stay in units of original pixel
 * spacing.
 *
 * @param image Decoded image (1, 3 or 4 channels)
 * @param mask Optional region mask, empty for the whole image. On where > 127
 * @param kernelSize Sobel aperture: 1, 3 or 5
 * @param maxLongEdge Downscale limit, 0 disables it
 * @return Non-negative score, 0.0 when no mask pixel is on
 * @throws InvalidArgument on empty image, bad kernel size, negative limit or mismatched mask
 */
double tenengrad(const cv::Mat& image, const cv::Mat& mask = cv::Mat(),
                 int kernelSize = 3, int maxLongEdge = 0);

/**
 * @brief Laplacian variance: population variance of the 3x3 Laplacian response over the masked pixels.
 *
 * Unlike tenengrad() the mask is never resized: it must be exactly the image size.
 *
 * @return Non-negative score, 0.0 when fewer than two mask pixels are on
 * @throws InvalidArgument on empty image or a mask of another size
 */
double laplacianVariance(const cv::Mat& image, const cv::Mat& mask = cv::Mat());

// Raw buffer variants: 8-bit grayscale, rows packed (stride == width).
// maskData may be nullptr, otherwise it has the same layout as data.
double tenengrad(const unsigned char* data, int width, int height,
                 const unsigned char* maskData, int kernelSize, int maxLongEdge);
double laplacianVariance(const unsigned char* data, int width, int height,
                         const unsigned char* maskData);

} // namespace sharpgate

#endif // SHARPGATE_SHARPNESS_EVALUATOR_H
