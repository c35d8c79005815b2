#ifndef SHARPGATE_LOGFILE_H
#define SHARPGATE_LOGFILE_H

#include <memory>
#include <spdlog/spdlog.h>

// Shared by every sharpgate component. Defined in logfile.cpp as a colour
// stdout logger; callers may replace it before use.
extern std::shared_ptr<spdlog::logger> logger;

#endif
