#ifndef SHARPGATE_GATE_CONFIG_H
#define SHARPGATE_GATE_CONFIG_H

#include <string>

namespace sharpgate {

/**
 * @struct GateConfig
 * @brief Thresholds and parameters of the capture sharpness gate.
 *
 * The default thresholds were tuned on masked scores at full resolution
 * (maxLongEdge = 0) with a 3x3 Sobel kernel.
 */
struct GateConfig {
    int kernelSize = 3;                ///< Sobel aperture for tenengrad (1, 3 or 5)
    int maxLongEdge = 0;               ///< Downscale limit for tenengrad, 0 = full resolution
    double tenengradThreshold = 3500.0; ///< Pass when tenengrad reaches this
    double laplacianThreshold = 750.0;  ///< ... or when laplacian variance reaches this
    double minCoverage = 0.05;         ///< Masks covering less than this are unreliable
    double maxCoverage = 0.75;         ///< Masks covering more than this are unreliable
    double probabilityCutoff = 0.05;   ///< Segmentation probability at which a pixel joins the mask
    int dilationRadius = 0;            ///< Mask dilation before scoring, 0 = none
    int helpAfterFailures = 5;         ///< Consecutive failures before help is offered
};

/**
 * @brief Checks every field of @p config.
 *
 * @throws InvalidArgument naming the first offending field
 */
void validate(const GateConfig& config);

/**
 * @brief Reads a GateConfig from a settings file.
 *
 * One `key = value` per line. Spaces are ignored and anything after `%` is a
 * comment. Keys match the GateConfig field names. Unknown keys are logged and
 * skipped. A file that cannot be opened yields the defaults.
 *
 * @param path Settings file path
 * @return Validated configuration
 * @throws InvalidArgument if a value cannot be parsed or the result is invalid
 */
GateConfig loadGateConfig(const std::string& path);

} // namespace sharpgate

#endif // SHARPGATE_GATE_CONFIG_H
