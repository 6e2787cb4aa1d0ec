#ifndef REQUESTSETTINGS_HPP
#define REQUESTSETTINGS_HPP

#include "tickhttp.hpp"

// Forward declaration
class ARequestHandler;

// Options of one HTTP transaction. A default-constructed value carries the
// built-in defaults; callers copy a defaults value, override fields and hand
// it to a Request, which keeps its own copy.
struct RequestSettings {
    codes::Method method_;
    std::string url_;
    std::string content_type_;
    codes::DataType data_type_;
    RequestData data_;  // Sent as query string (GET) or body (POST)
    bool traditional_;  // k=v1&k=v2 instead of k[]=v1&k[]=v2

    // Extra headers, sent after the built-in ones; same name overrides
    std::vector<std::pair<std::string, std::string> > headers_;
    std::string user_agent_;

    int connect_timeout_ms_;
    int header_timeout_ms_;     // Per line while reading the response header
    int body_read_timeout_ms_;  // Per tick while reading the body
    int max_retries_;           // Empty body reads tolerated
    long timeout_ms_;           // Overall deadline, 0 for none
    bool fail_on_http_error_;   // 4xx/5xx take the error path

    ARequestHandler* handler_;  // Not owned, NULL for the logging handler

    // Default constructor
    RequestSettings();

    void add_data(const std::string& key, const std::string& value);
    void set_header(const std::string& name, const std::string& value);

    // Applies one "key value" directive, as found in a settings file.
    // Returns false (and logs) for unknown keys and malformed values.
    bool apply_directive(const std::string& key, const std::string& value);

    // Validation method
    bool is_valid(std::string& error_msg) const;

    // Loads the defaults block of a settings file. tick_interval_ms is only
    // changed if the file sets it.
    static bool parse_file(const std::string& filename,
                           RequestSettings& settings, int& tick_interval_ms);
    static bool parse_defaults_block(std::ifstream& file,
                                     RequestSettings& settings,
                                     int& tick_interval_ms);

    // Handles the process-wide directives (log_level, tick_interval) and
    // forwards everything else to apply_directive.
    static bool handle_directive(const std::string& key,
                                 const std::string& value,
                                 RequestSettings& settings,
                                 int& tick_interval_ms);
    static bool parse_directive(const std::string& line, std::string& key,
                                std::string& value);

    static std::string default_user_agent();

   private:
    static bool parse_millis(const std::string& key, const std::string& value,
                             long& out);
    static bool parse_flag(const std::string& key, const std::string& value,
                           bool& out);
    static bool split_pair(const std::string& key, const std::string& value,
                           std::string& name, std::string& rest);
};

#endif  // REQUESTSETTINGS_HPP
