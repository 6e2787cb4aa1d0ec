#include "tickhttp.hpp"

// Request defaults
static const codes::Method DEFAULT_METHOD = codes::METHOD_GET;
static const std::string DEFAULT_CONTENT_TYPE =
    "application/x-www-form-urlencoded";
static const codes::DataType DEFAULT_DATA_TYPE = codes::DATA_TEXT;
static const bool DEFAULT_TRADITIONAL = false;
static const long DEFAULT_TIMEOUT_MS = 0;
static const bool DEFAULT_FAIL_ON_HTTP_ERROR = false;

RequestSettings::RequestSettings()
    : method_(DEFAULT_METHOD),
      content_type_(DEFAULT_CONTENT_TYPE),
      data_type_(DEFAULT_DATA_TYPE),
      traditional_(DEFAULT_TRADITIONAL),
      connect_timeout_ms_(http_limits::CONNECT_TIMEOUT_MS),
      header_timeout_ms_(http_limits::HEADER_TIMEOUT_MS),
      body_read_timeout_ms_(http_limits::BODY_READ_TIMEOUT_MS),
      max_retries_(http_limits::MAX_RETRIES),
      timeout_ms_(DEFAULT_TIMEOUT_MS),
      fail_on_http_error_(DEFAULT_FAIL_ON_HTTP_ERROR),
      handler_(NULL) {
    user_agent_ = default_user_agent();
}

void RequestSettings::add_data(const std::string& key,
                               const std::string& value) {
    data_[key].push_back(value);
}

void RequestSettings::set_header(const std::string& name,
                                 const std::string& value) {
    std::string lower_name = to_lower(name);
    for (size_t i = 0; i < headers_.size(); ++i) {
        if (to_lower(headers_[i].first) == lower_name) {
            headers_[i].second = value;
            return;
        }
    }
    headers_.push_back(std::make_pair(name, value));
}

std::string RequestSettings::default_user_agent() {
    std::string platform = "unknown";
    struct utsname info;
    if (uname(&info) == 0) {
        platform = to_lower(info.sysname);
    }
    return std::string("tickhttp/") + TICKHTTP_VERSION + " (" + platform + ")";
}

bool RequestSettings::apply_directive(const std::string& key,
                                      const std::string& value) {
    if (key == "method") {
        return parse_method(value, method_);
    } else if (key == "url") {
        url_ = value;
    } else if (key == "content_type") {
        content_type_ = value;
    } else if (key == "data_type") {
        return parse_data_type(value, data_type_);
    } else if (key == "traditional") {
        return parse_flag(key, value, traditional_);
    } else if (key == "fail_on_http_error") {
        return parse_flag(key, value, fail_on_http_error_);
    } else if (key == "header") {
        std::string name, header_value;
        if (!split_pair(key, value, name, header_value)) {
            return false;
        }
        set_header(name, header_value);
    } else if (key == "data") {
        std::string data_key, data_value;
        if (!split_pair(key, value, data_key, data_value)) {
            return false;
        }
        add_data(data_key, data_value);
    } else if (key == "user_agent") {
        user_agent_ = value;
    } else if (key == "connect_timeout" || key == "header_timeout" ||
               key == "body_read_timeout" || key == "max_retries") {
        long number = 0;
        if (!parse_millis(key, value, number)) {
            return false;
        }
        if (key == "connect_timeout") {
            connect_timeout_ms_ = static_cast<int>(number);
        } else if (key == "header_timeout") {
            header_timeout_ms_ = static_cast<int>(number);
        } else if (key == "body_read_timeout") {
            body_read_timeout_ms_ = static_cast<int>(number);
        } else {
            max_retries_ = static_cast<int>(number);
        }
    } else if (key == "timeout") {
        return parse_millis(key, value, timeout_ms_);
    } else {
        log(LOG_ERROR, "Unknown directive: %s", key.c_str());
        return false;
    }
    return true;
}

bool RequestSettings::is_valid(std::string& error_msg) const {
    if (url_.empty()) {
        error_msg = "No URL given";
        return false;
    }
    if (max_retries_ <= 0) {
        error_msg = "max_retries must be positive";
        return false;
    }
    if (connect_timeout_ms_ < 0 || header_timeout_ms_ < 0 ||
        body_read_timeout_ms_ < 0 || timeout_ms_ < 0) {
        error_msg = "Timeouts cannot be negative";
        return false;
    }
    return true;
}

bool RequestSettings::parse_file(const std::string& filename,
                                 RequestSettings& settings,
                                 int& tick_interval_ms) {
    // Check file extension
    std::string::size_type pos = filename.find_last_of(".");
    if (pos == std::string::npos || filename.substr(pos) != ".conf") {
        log(LOG_ERROR, "Invalid settings file extension: %s",
            filename.c_str());
        return false;
    }

    // Open the settings file
    std::ifstream file(filename.c_str());
    if (!file.is_open()) {
        log(LOG_ERROR, "Could not open settings file: %s", filename.c_str());
        return false;
    }

    bool found_block = false;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Look for defaults block
        if (line.find("defaults") == 0 && line.find("{") != std::string::npos) {
            if (!parse_defaults_block(file, settings, tick_interval_ms)) {
                return false;
            }
            found_block = true;
        } else {
            log(LOG_ERROR, "Unexpected line outside defaults block: %s",
                line.c_str());
            return false;
        }
    }

    if (!found_block) {
        log(LOG_WARNING, "No defaults block in %s", filename.c_str());
    }

    log(LOG_DEBUG, "Loaded settings from %s", filename.c_str());
    return true;
}

bool RequestSettings::parse_defaults_block(std::ifstream& file,
                                           RequestSettings& settings,
                                           int& tick_interval_ms) {
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for block end
        if (line == "}") {
            return true;
        }

        std::string key, value;
        if (!parse_directive(line, key, value)) {
            log(LOG_ERROR, "Invalid directive in defaults block: %s",
                line.c_str());
            return false;
        }
        if (!handle_directive(key, value, settings, tick_interval_ms)) {
            return false;
        }
    }

    // Reached end of file without closing brace
    log(LOG_ERROR, "Defaults block is not closed");
    return false;
}

bool RequestSettings::handle_directive(const std::string& key,
                                       const std::string& value,
                                       RequestSettings& settings,
                                       int& tick_interval_ms) {
    if (key == "log_level") {
        log_level level;
        if (!parse_log_level(value, level)) {
            log(LOG_ERROR, "Invalid log_level: %s", value.c_str());
            return false;
        }
        set_log_level(level);
        return true;
    } else if (key == "tick_interval") {
        long interval = 0;
        if (!parse_millis(key, value, interval)) {
            return false;
        }
        if (interval == 0) {
            log(LOG_ERROR, "tick_interval must be positive");
            return false;
        }
        tick_interval_ms = static_cast<int>(interval);
        return true;
    }
    return settings.apply_directive(key, value);
}

bool RequestSettings::parse_directive(const std::string& line,
                                      std::string& key, std::string& value) {
    size_t pos = line.find_first_of(" \t");

    if (pos == std::string::npos) {
        return false;
    }

    key = line.substr(0, pos);

    // '#' starts a comment only at the beginning of a word
    std::string effective_line = line;
    for (size_t i = pos; i < line.size(); ++i) {
        if (line[i] == '#' && i > 0 &&
            (line[i - 1] == ' ' || line[i - 1] == '\t')) {
            effective_line = line.substr(0, i);
            break;
        }
    }

    // Find the start of the value (skip whitespace)
    size_t value_start = effective_line.find_first_not_of(" \t", pos);
    if (value_start == std::string::npos) return false;

    // Only a trailing semicolon terminates the directive
    value = trim(effective_line.substr(value_start));
    if (!value.empty() && value[value.size() - 1] == ';') {
        value = trim(value.substr(0, value.size() - 1));
    }

    return !value.empty();
}

bool RequestSettings::parse_millis(const std::string& key,
                                   const std::string& value, long& out) {
    if (value.empty() || value.size() > 9) {
        log(LOG_ERROR, "Invalid %s value: %s", key.c_str(), value.c_str());
        return false;
    }

    // Check that value contains only digits
    for (size_t i = 0; i < value.length(); i++) {
        if (!isdigit(static_cast<unsigned char>(value[i]))) {
            log(LOG_ERROR, "Invalid %s value: %s", key.c_str(),
                value.c_str());
            return false;
        }
    }

    std::istringstream iss(value);
    if (!(iss >> out)) {
        log(LOG_ERROR, "Invalid number format in %s: %s", key.c_str(),
            value.c_str());
        return false;
    }
    return true;
}

bool RequestSettings::parse_flag(const std::string& key,
                                 const std::string& value, bool& out) {
    std::string lower = to_lower(value);
    if (lower == "on" || lower == "true" || lower == "1") {
        out = true;
    } else if (lower == "off" || lower == "false" || lower == "0") {
        out = false;
    } else {
        log(LOG_ERROR, "Invalid %s value (expected on or off): %s",
            key.c_str(), value.c_str());
        return false;
    }
    return true;
}

// "<name> <rest...>"; rest may be empty
bool RequestSettings::split_pair(const std::string& key,
                                 const std::string& value, std::string& name,
                                 std::string& rest) {
    size_t pos = value.find_first_of(" \t");
    name = value.substr(0, pos);
    rest = pos == std::string::npos ? "" : trim(value.substr(pos));

    if (name.empty()) {
        log(LOG_ERROR, "Missing name in %s directive", key.c_str());
        return false;
    }
    return true;
}
