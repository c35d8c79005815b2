#include "sharpness_gate.hpp"
#include "logfile.hpp"
#include "mask_utils.hpp"
#include "sharpness_evaluator.hpp"

namespace sharpgate {

const char* verdictName(GateVerdict verdict) {
    switch (verdict) {
    case GateVerdict::Pass:
        return "pass";
    case GateVerdict::Blurry:
        return "blurry";
    case GateVerdict::MaskUnreliable:
        return "mask-unreliable";
    }
    return "unknown";
}

SharpnessGate::SharpnessGate(const GateConfig& config)
    : m_config(config) {
    validate(m_config);
}

GateReport SharpnessGate::evaluate(const cv::Mat& image, const cv::Mat& mask) const {
    GateReport report;
    const bool haveMask = !mask.empty();

    // Coverage is taken on the mask as supplied, before dilation or resizing
    report.coverage = haveMask ? maskCoverage(mask) : 1.0;

    // Both metrics need the mask at image size; laplacianVariance does not resize it
    cv::Mat scoringMask;
    if (haveMask) {
        scoringMask = alignMask(mask, image.size());
        if (m_config.dilationRadius > 0) {
            scoringMask = dilateMask(scoringMask, m_config.dilationRadius);
        }
    }

    report.tenengrad = tenengrad(image, scoringMask, m_config.kernelSize, m_config.maxLongEdge);
    report.laplacianVariance = laplacianVariance(image, scoringMask);

    if (haveMask && (report.coverage < m_config.minCoverage || report.coverage > m_config.maxCoverage)) {
        report.verdict = GateVerdict::MaskUnreliable;
    } else if (report.tenengrad >= m_config.tenengradThreshold ||
               report.laplacianVariance >= m_config.laplacianThreshold) {
        report.verdict = GateVerdict::Pass;
    } else {
        report.verdict = GateVerdict::Blurry;
    }

    logger->info("[SharpnessGate] coverage={:.0f}% tenengrad={:.1f} lapVar={:.1f} -> {}",
                 report.coverage * 100.0, report.tenengrad, report.laplacianVariance,
                 verdictName(report.verdict));
    return report;
}

GateReport SharpnessGate::evaluateProbability(const cv::Mat& image, const cv::Mat& probability) const {
    cv::Mat mask = maskFromProbability(probability, m_config.probabilityCutoff);
    return evaluate(image, mask);
}

} // namespace sharpgate
