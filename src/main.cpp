#include "tickhttp.hpp"

static const int EXIT_USAGE = 2;

// Writes the decoded body to stdout and remembers the outcome.
class FetchHandler : public ARequestHandler {
   public:
    FetchHandler() : succeeded_(false), completed_(false) {}

    void on_success(const DecodedContent& data, codes::TextStatus status,
                    Request* request) {
        succeeded_ = true;
        if (status == codes::STATUS_NOTMODIFIED) {
            log(LOG_INFO, "%s not modified", request->url().c_str());
            return;
        }
        print_content(data);
    }

    void on_error(Request* request, codes::TextStatus status,
                  const std::string& error) {
        succeeded_ = false;
        std::cerr << request->url() << ": " << text_status_name(status);
        if (!error.empty()) {
            std::cerr << ": " << error;
        }
        std::cerr << std::endl;
    }

    void on_complete(Request* request, codes::TextStatus status) {
        (void)status;
        completed_ = true;
        log(LOG_DEBUG, "%s: %zu bytes received", request->url().c_str(),
            request->length());
    }

    bool succeeded() const { return succeeded_; }
    bool completed() const { return completed_; }

   private:
    bool succeeded_;
    bool completed_;

    static void print_xml(const XmlNode& node, int depth) {
        std::string indent(depth * 2, ' ');
        std::cout << indent << "<" << node.name_;
        for (std::map<std::string, std::string>::const_iterator it =
                 node.attributes_.begin();
             it != node.attributes_.end(); ++it) {
            std::cout << " " << it->first << "=\"" << it->second << "\"";
        }
        std::cout << ">";
        if (!node.text_.empty()) {
            std::cout << " " << node.text_;
        }
        std::cout << std::endl;
        for (size_t i = 0; i < node.children_.size(); ++i) {
            print_xml(node.children_[i], depth + 1);
        }
    }

    static void print_content(const DecodedContent& data) {
        switch (data.data_type_) {
            case codes::DATA_JSON:
                std::cout << data.json_.dump(2) << std::endl;
                break;
            case codes::DATA_XML:
                if (!data.xml_.name_.empty()) {
                    print_xml(data.xml_, 0);
                }
                break;
            case codes::DATA_TEXT:
            case codes::DATA_HTML:
                std::cout << data.text_;
                break;
            default:
                for (size_t i = 0; i < data.fragments_.size(); ++i) {
                    std::cout << data.fragments_[i];
                }
                break;
        }
        std::cout.flush();
    }
};

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [-c settings.conf] [-X METHOD] [-t DATA_TYPE]"
                 " [-o key=value]... [-d key=value]... <url>"
              << std::endl;
}

// "key=value" -> key, value
static bool split_option(const std::string& option, std::string& key,
                         std::string& value) {
    size_t pos = option.find('=');
    if (pos == std::string::npos || pos == 0) {
        return false;
    }
    key = option.substr(0, pos);
    value = option.substr(pos + 1);
    return true;
}

int main(int argc, char* argv[]) {
    RequestSettings settings;
    int tick_interval = http_limits::TICK_INTERVAL_MS;

    std::string config_file;
    std::vector<std::string> overrides;
    std::vector<std::string> data;
    std::string method;
    std::string data_type;
    std::string url;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "-c" && has_value) {
            config_file = argv[++i];
        } else if (arg == "-X" && has_value) {
            method = argv[++i];
        } else if (arg == "-t" && has_value) {
            data_type = argv[++i];
        } else if (arg == "-o" && has_value) {
            overrides.push_back(argv[++i]);
        } else if (arg == "-d" && has_value) {
            data.push_back(argv[++i]);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else if (!arg.empty() && arg[0] != '-' && url.empty()) {
            url = arg;
        } else {
            print_usage(argv[0]);
            return EXIT_USAGE;
        }
    }

    // Settings file first, command line options override it
    if (!config_file.empty() &&
        !RequestSettings::parse_file(config_file, settings, tick_interval)) {
        return EXIT_USAGE;
    }

    for (size_t i = 0; i < overrides.size(); ++i) {
        std::string key, value;
        if (!split_option(overrides[i], key, value) ||
            !RequestSettings::handle_directive(key, value, settings,
                                               tick_interval)) {
            std::cerr << "Invalid option: " << overrides[i] << std::endl;
            return EXIT_USAGE;
        }
    }
    for (size_t i = 0; i < data.size(); ++i) {
        std::string key, value;
        if (!split_option(data[i], key, value)) {
            std::cerr << "Invalid data: " << data[i] << std::endl;
            return EXIT_USAGE;
        }
        settings.add_data(key, value);
    }
    if (!method.empty() && !parse_method(method, settings.method_)) {
        return EXIT_USAGE;
    }
    if (!data_type.empty() && !parse_data_type(data_type, settings.data_type_)) {
        return EXIT_USAGE;
    }
    if (!url.empty()) {
        settings.url_ = url;
    }

    std::string error_msg;
    if (!settings.is_valid(error_msg)) {
        std::cerr << error_msg << std::endl;
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    FetchHandler handler;
    settings.handler_ = &handler;

    IdleLoop idle_loop(tick_interval);
    if (!idle_loop.setup_signal_handlers()) {
        return EXIT_FAILURE;
    }

    SocketTransportFactory transport_factory;
    RequestPool pool(&idle_loop, &transport_factory);

    // Spin up the request and tick until it is done
    pool.send(settings);
    idle_loop.run();

    if (!handler.completed()) {
        // Interrupted before the response was complete
        pool.cancel_all();
    }

    return handler.succeeded() ? EXIT_SUCCESS : EXIT_FAILURE;
}
