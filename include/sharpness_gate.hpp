#ifndef SHARPGATE_SHARPNESS_GATE_H
#define SHARPGATE_SHARPNESS_GATE_H

#include <opencv2/core.hpp>
#include "gate_config.hpp"

namespace sharpgate {

enum class GateVerdict {
    Pass,
    Blurry,
    MaskUnreliable
};

const char* verdictName(GateVerdict verdict);

struct GateReport {
    double tenengrad = 0.0;
    double laplacianVariance = 0.0;
    double coverage = 0.0;   ///< Fraction of on pixels before dilation, 1.0 without a mask
    GateVerdict verdict = GateVerdict::Blurry;

    bool passed() const { return verdict == GateVerdict::Pass; }
};

/**
 * @class SharpnessGate
 * @brief Decides whether a captured image is sharp enough inside its region of interest.
 *
 * A supplied mask must first cover a plausible fraction of the image; then the
 * capture passes if either the tenengrad or the laplacian variance score
 * reaches its threshold. The gate holds only its configuration, so one
 * instance can be shared between threads.
 */
class SharpnessGate {
public:
    /**
     * @throws InvalidArgument if the configuration does not validate
     */
    explicit SharpnessGate(const GateConfig& config = GateConfig());

    /**
     * @brief Scores @p image inside @p mask and returns the verdict with the scores.
     *
     * @param image Decoded image
     * @param mask Region mask, empty to score the whole image (coverage check skipped)
     * @throws InvalidArgument for the same inputs the metrics reject
     */
    GateReport evaluate(const cv::Mat& image, const cv::Mat& mask = cv::Mat()) const;

    /**
     * @brief Like evaluate(), with the region given as a segmentation probability map.
     *
     * The map is thresholded at GateConfig::probabilityCutoff; it may be smaller
     * than the image as long as the aspect ratio matches.
     *
     * @param image Decoded image
     * @param probability Single channel map, values clamped to [0, 1]
     * @throws InvalidArgument for an empty or multi-channel map, or inputs the metrics reject
     */
    GateReport evaluateProbability(const cv::Mat& image, const cv::Mat& probability) const;

    const GateConfig& config() const { return m_config; }

private:
    GateConfig m_config;
};

} // namespace sharpgate

#endif // SHARPGATE_SHARPNESS_GATE_H
