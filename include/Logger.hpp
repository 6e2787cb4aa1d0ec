#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "tickhttp.hpp"

class Request;
struct HttpRequest;
struct HttpResponse;

void print_request(const HttpRequest* request);
void print_response(const HttpResponse* response);
void print_contents(const Request* request);

#define RESET "\x1B[0m"
#define RED "\x1B[31m"
#define LIGHT_RED "\x1B[91m"
#define WHITE "\x1B[37m"
#define YELLOW "\x1B[33m"
#define LIGHT_BLUE "\x1B[94m"
#define CYAN "\x1B[36m"
#define MAGENTA "\x1B[95m"

enum log_level {
    LOG_OFF,
    LOG_TRACE,
    LOG_DEBUG,
    LOG_INFO,
    LOG_WARNING,
    LOG_ERROR,
    LOG_FATAL
};

// Messages below the active level are dropped. Returns the number of
// characters formatted, 0 when the message was filtered.
int log(log_level level, const char* msg, ...);

void set_log_level(log_level level);
log_level get_log_level();
bool parse_log_level(const std::string& name, log_level& out);

std::string get_current_gmt_time();

#endif  // LOGGER_HPP
