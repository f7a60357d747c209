#ifndef LOGGING_H
#define LOGGING_H

#include <string>

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

void set_log_level(LogLevel level);
LogLevel get_log_level();

// Prints "[TAG] text" to stderr when level passes the threshold.
void log_message(LogLevel level, const std::string &tag,
                 const std::string &text);

#endif
