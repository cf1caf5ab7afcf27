/**
 * @file logging.h
 * @brief Logging helpers with a runtime verbose flag.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>

namespace butler {

/// Global verbose logging flag, set via --verbose command line argument
inline bool verboseLogging = false;

} // namespace butler

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (butler::verboseLogging) qDebug()

#endif // LOGGING_H
