#include "gate_config.hpp"
#include "errors.hpp"
#include "logfile.hpp"

#include <fstream>

namespace sharpgate {

namespace {

int parseInt(const std::string& tag, const std::string& value) {
    try {
        std::size_t used = 0;
        int out = std::stoi(value, &used);
        if (used == value.size()) {
            return out;
        }
    } catch (const std::logic_error&) {
        // std::invalid_argument or std::out_of_range, reported below
    }
    logger->error("[GateConfig] Invalid integer for {}: '{}'", tag, value);
    throw InvalidArgument("invalid integer for " + tag + ": '" + value + "'");
}

double parseDouble(const std::string& tag, const std::string& value) {
    try {
        std::size_t used = 0;
        double out = std::stod(value, &used);
        if (used == value.size()) {
            return out;
        }
    } catch (const std::logic_error&) {
        // std::invalid_argument or std::out_of_range, reported below
    }
    logger->error("[GateConfig] Invalid number for {}: '{}'", tag, value);
    throw InvalidArgument("invalid number for " + tag + ": '" + value + "'");
}

void fail(const std::string& message) {
    logger->error("[GateConfig] {}", message);
    throw InvalidArgument(message);
}

} // namespace

void validate(const GateConfig& config) {
    if (config.kernelSize != 1 && config.kernelSize != 3 && config.kernelSize != 5)
        fail("kernelSize must be 1, 3 or 5");
    if (config.maxLongEdge < 0)
        fail("maxLongEdge must be non-negative");
    if (config.tenengradThreshold < 0.0 || config.laplacianThreshold < 0.0)
        fail("thresholds must be non-negative");
    if (config.minCoverage < 0.0 || config.maxCoverage > 1.0 || config.minCoverage > config.maxCoverage)
        fail("coverage window must satisfy 0 <= minCoverage <= maxCoverage <= 1");
    if (config.probabilityCutoff < 0.0 || config.probabilityCutoff > 1.0)
        fail("probabilityCutoff must be in [0, 1]");
    if (config.dilationRadius < 0)
        fail("dilationRadius must be non-negative");
    if (config.helpAfterFailures < 1)
        fail("helpAfterFailures must be at least 1");
}

GateConfig loadGateConfig(const std::string& path) {
    GateConfig config;

    std::ifstream file(path);
    if (!file.is_open()) {
        logger->warn("[GateConfig] Could not open {}, using defaults", path);
        return config;
    }

    std::string line;
    std::size_t pos;
    while (std::getline(file, line)) {
        // Ignore comments
        if ((pos = line.find('%')) != std::string::npos) line.erase(pos);
        while ((pos = line.find(' ')) != std::string::npos) line.erase(pos, 1);
        while ((pos = line.find('\t')) != std::string::npos) line.erase(pos, 1);
        while ((pos = line.find('\r')) != std::string::npos) line.erase(pos, 1);

        pos = line.find('=');
        if (pos == std::string::npos)
            continue;

        std::string tag = line.substr(0, pos);
        std::string value = line.substr(pos + 1);

        if (tag == "kernelSize") config.kernelSize = parseInt(tag, value);
        else if (tag == "maxLongEdge") config.maxLongEdge = parseInt(tag, value);
        else if (tag == "tenengradThreshold") config.tenengradThreshold = parseDouble(tag, value);
        else if (tag == "laplacianThreshold") config.laplacianThreshold = parseDouble(tag, value);
        else if (tag == "minCoverage") config.minCoverage = parseDouble(tag, value);
        else if (tag == "maxCoverage") config.maxCoverage = parseDouble(tag, value);
        else if (tag == "probabilityCutoff") config.probabilityCutoff = parseDouble(tag, value);
        else if (tag == "dilationRadius") config.dilationRadius = parseInt(tag, value);
        else if (tag == "helpAfterFailures") config.helpAfterFailures = parseInt(tag, value);
        else logger->warn("[GateConfig] Ignoring unknown setting '{}'", tag);
    }
    file.close();

    validate(config);
    logger->info("[GateConfig] Loaded {}: tenengrad>={} laplacian>={} coverage=[{}, {}]",
                 path, config.tenengradThreshold, config.laplacianThreshold,
                 config.minCoverage, config.maxCoverage);
    return config;
}

} // namespace sharpgate
