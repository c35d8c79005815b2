#ifndef SHARPGATE_ERRORS_H
#define SHARPGATE_ERRORS_H

#include <stdexcept>
#include <string>

namespace sharpgate {

/**
 * @brief The only error sharpgate raises.
 *
 * Thrown for a missing or malformed image, an unsupported Sobel kernel size,
 * a mask that cannot be aligned with its image, or a bad configuration value.
 */
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace sharpgate

#endif // SHARPGATE_ERRORS_H
