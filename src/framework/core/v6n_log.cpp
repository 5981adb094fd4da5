#include <array>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <string_view>

#include <strings.h>
#include <sys/time.h>

#include "core/v6n_log.h"

namespace v6net::log {

static std::atomic<v6n_log_level> log_level{V6N_LOG_INFO};
static std::atomic<FILE*> log_stream{nullptr};
static std::mutex log_mutex;

constexpr auto level_names = std::array<std::string_view, V6N_LOG_MAX>{
    "none", "critical", "error", "warning", "info", "debug", "trace"};

static FILE* get_stream()
{
    auto stream = log_stream.load(std::memory_order_relaxed);
    return (stream ? stream : stderr);
}

/*
 * Find the end of the function name: the first opening parenthesis that is
 * not nested inside a template argument list.
 */
static size_t find_arguments_start(std::string_view signature)
{
    auto depth = 0;
    for (size_t idx = 0; idx < signature.size(); idx++) {
        switch (signature[idx]) {
        case '<':
            depth++;
            break;
        case '>':
            depth--;
            break;
        case '(':
            if (depth == 0) { return (idx); }
            break;
        default:
            break;
        }
    }

    return (signature.size());
}

/*
 * Find the start of the function name: the character after the last space
 * that precedes the name and is not nested inside a template argument list.
 */
static size_t find_name_start(std::string_view signature, size_t end)
{
    auto depth = 0;
    for (size_t idx = end; idx > 0; idx--) {
        switch (signature[idx - 1]) {
        case '>':
            depth++;
            break;
        case '<':
            depth--;
            break;
        case ' ':
        case '&':
        case '*':
            if (depth == 0) { return (idx); }
            break;
        default:
            break;
        }
    }

    return (0);
}

} // namespace v6net::log

extern "C" {

using namespace v6net::log;

enum v6n_log_level v6n_log_level_get(void)
{
    return (log_level.load(std::memory_order_relaxed));
}

void v6n_log_level_set(enum v6n_log_level level)
{
    log_level.store(level, std::memory_order_relaxed);
}

const char* v6n_log_level_name(enum v6n_log_level level)
{
    if (level < V6N_LOG_NONE || level >= V6N_LOG_MAX) { return ("unknown"); }
    return (level_names[level].data());
}

enum v6n_log_level parse_log_optarg(const char* arg)
{
    if (!arg || strlen(arg) > V6N_LOG_MAX_LEVEL_LENGTH) {
        return (V6N_LOG_NONE);
    }

    if (std::isdigit(static_cast<unsigned char>(arg[0]))) {
        char* end = nullptr;
        errno = 0;
        auto value = strtol(arg, &end, 10);
        if (errno || *end != '\0' || value <= V6N_LOG_NONE
            || value >= V6N_LOG_MAX) {
            return (V6N_LOG_NONE);
        }
        return (static_cast<v6n_log_level>(value));
    }

    for (int level = V6N_LOG_CRITICAL; level < V6N_LOG_MAX; level++) {
        if (strcasecmp(arg, level_names[level].data()) == 0) {
            return (static_cast<v6n_log_level>(level));
        }
    }

    return (V6N_LOG_NONE);
}

enum v6n_log_level v6n_log_level_find(int argc, char* const argv[])
{
    for (int idx = 0; idx < argc - 1; idx++) {
        if (strcmp(argv[idx], "--core.log.level") == 0
            || strcmp(argv[idx], "-l") == 0) {
            return (parse_log_optarg(argv[idx + 1]));
        }
    }

    return (V6N_LOG_NONE);
}

void v6n_log_function_name(const char* signature, char* function)
{
    auto sig = std::string_view(signature);
    auto end = find_arguments_start(sig);
    auto start = find_name_start(sig, end);

    auto name = sig.substr(start, end - start);
    name.copy(function, name.size());
    function[name.size()] = '\0';
}

void v6n_log_stream_set(FILE* stream)
{
    log_stream.store(stream, std::memory_order_relaxed);
}

int v6n_vlog(enum v6n_log_level level,
             const char* tag,
             const char* format,
             va_list argp)
{
    if (level <= V6N_LOG_NONE || level >= V6N_LOG_MAX) { return (-EINVAL); }

    struct timeval now;
    gettimeofday(&now, nullptr);
    struct tm local;
    localtime_r(&now.tv_sec, &local);

    auto timestamp = std::array<char, 32>{};
    strftime(timestamp.data(), timestamp.size(), "%FT%T", &local);

    auto guard = std::lock_guard<std::mutex>(log_mutex);
    auto stream = get_stream();
    if (fprintf(stream,
                "%s.%06ld [%s] %s: ",
                timestamp.data(),
                static_cast<long>(now.tv_usec),
                level_names[level].data(),
                tag ? tag : "")
        < 0) {
        return (-EIO);
    }
    if (vfprintf(stream, format, argp) < 0) { return (-EIO); }

    /* Terminate unterminated messages */
    auto length = strlen(format);
    if (length == 0 || format[length - 1] != '\n') { fputc('\n', stream); }

    return (0);
}

int v6n_log(enum v6n_log_level level, const char* tag, const char* format, ...)
{
    va_list argp;
    va_start(argp, format);
    auto result = v6n_vlog(level, tag, format, argp);
    va_end(argp);
    return (result);
}

} // extern "C"
