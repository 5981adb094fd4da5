#ifndef _V6N_LOG_H_
#define _V6N_LOG_H_

#ifdef __cplusplus
extern "C" {
#endif

#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>
#include <string.h>

enum v6n_log_level {
    V6N_LOG_NONE = 0,
    V6N_LOG_CRITICAL, /**< Fatal error condition */
    V6N_LOG_ERROR,    /**< Non-fatal error condition */
    V6N_LOG_WARNING,  /**< Unexpected event or condition */
    V6N_LOG_INFO,     /**< Informational messages */
    V6N_LOG_DEBUG,    /**< Debugging messages */
    V6N_LOG_TRACE,    /**< Trace level messages */
    V6N_LOG_MAX,
};

/**
 * Get the application log level
 *
 * @return
 *   The current system log level
 */
enum v6n_log_level v6n_log_level_get(void) __attribute__((pure));

/**
 * Set the application log level
 *
 * @param level
 *   A value between V6N_LOG_CRITICAL (1) and V6N_LOG_TRACE (6)
 */
void v6n_log_level_set(enum v6n_log_level level);

/**
 * Retrieve the log level from the command line
 *
 * @param[in] argc
 *   The number of cli arguments
 * @param[in] argv
 *   Array of cli strings
 *
 * @return
 *   log level found in cli arguments (may be V6N_LOG_NONE)
 */
enum v6n_log_level v6n_log_level_find(int argc, char* const argv[]);

/**
 * Maximum length (in chars) of a log level value.
 */
static const size_t V6N_LOG_MAX_LEVEL_LENGTH = 8;

/**
 * Parse a log level argument to the associated enum value.
 * Both level names (case insensitive) and numbers are accepted.
 *
 * @param[in] arg
 *   Log level argument to parse
 *
 * @return
 *   log level found in arg, V6N_LOG_NONE otherwise
 */
enum v6n_log_level parse_log_optarg(const char* arg);

/**
 * Get the name of a log level, e.g. "warning".
 */
const char* v6n_log_level_name(enum v6n_log_level level);

/**
 * Get the full function name from the full function signature string
 *
 * @param[in] signature
 *   The full function signature
 * @parma[out] function
 *   Buffer for function name; should be at least as long as signature
 */
void v6n_log_function_name(const char* signature, char* function);

/**
 * Redirect log output. Messages go to stderr until this is called.
 *
 * @param stream
 *   Destination for log messages; NULL restores stderr
 */
void v6n_log_stream_set(FILE* stream);

/**
 * Macro to possibly write a message to the log
 * Note: this is the preferred way to do logging, since logging arguments will
 * not be evaluated unless they will actually get logged.
 *
 * @param level
 *   The level of the message
 * @param format
 *   The printf format string, followed by variable arguments
 */
#define V6N_LOG(level, format, ...)                                            \
    do {                                                                       \
        if (level <= v6n_log_level_get()) {                                    \
            char function_[strlen(__PRETTY_FUNCTION__) + 1];                   \
            v6n_log_function_name(__PRETTY_FUNCTION__, function_);             \
            v6n_log(level, function_, format, ##__VA_ARGS__);                  \
        }                                                                      \
    } while (0)

/**
 * Write a message to the log
 *
 * @param level
 *   The level of the message
 * @param tag
 *   Additional information to add to message
 * @param format
 *   The printf format string, followed by variable arguments
 * @return
 *   -  0: Success
 *   - !0: Error
 */
int v6n_log(enum v6n_log_level level, const char* tag, const char* format, ...)
    __attribute__((format(printf, 3, 4)));

int v6n_vlog(enum v6n_log_level level,
             const char* tag,
             const char* format,
             va_list argp);

#ifdef __cplusplus
}
#endif

#endif
