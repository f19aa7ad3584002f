#include "deltastore/tool/tool_config.hpp"
#include "deltastore/storage/serde.hpp"
#include "deltastore/storage/url.hpp"

#include <cstring>
#include <fstream>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>

namespace deltastore {

namespace {

// Positional argument count (after the URL) accepted by each command
const std::map<std::string, std::pair<size_t, size_t>>& command_arity() {
    static const std::map<std::string, std::pair<size_t, size_t>> arity = {
        {"ls", {0, 1}},
        {"lsd", {0, 1}},
        {"cat", {1, 1}},
        {"head", {1, 1}},
        {"put", {2, 2}},
        {"rm", {1, 1}},
        {"cp", {2, 2}},
        {"mv", {2, 2}},
        {"commit-path", {1, 1}},
    };
    return arity;
}

}  // namespace

void ToolConfig::print_usage() {
    std::cerr <<
        "Usage: deltastore-tool [options] <command> <url> [args]\n"
        "\n"
        "Commands:\n"
        "  ls <url> [prefix]                List objects recursively\n"
        "  lsd <url> [prefix]               List one level (objects and common prefixes)\n"
        "  cat <url> <key>                  Write an object to stdout\n"
        "  head <url> <key>                 Show object metadata\n"
        "  put <url> <key> <local-file>     Upload a local file\n"
        "  rm <url> <key>                   Delete an object\n"
        "  cp <url> <from> <to>             Copy an object\n"
        "  mv <url> <from> <to>             Rename an object\n"
        "  commit-path <url> <version>      Print the commit file location of a version\n"
        "\n"
        "Options:\n"
        "  --config <path>                  JSON config file\n"
        "  --option <key>=<value>           Storage option (repeatable)\n"
        "  --isolate-io                     Run store I/O on a dedicated IO runtime\n"
        "  --io-threads <N>                 IO runtime worker threads (default: hardware)\n"
        "  --io-thread-name <name>          IO runtime thread name (default: IO-runtime)\n"
        "  --current-thread                 Single-threaded IO runtime\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --verbose                        Verbose output\n"
        "  --help                           Show this help\n";
}

std::optional<ToolConfig> ToolConfig::from_args(int argc, char* argv[]) {
    ToolConfig config;
    std::vector<std::string> positional;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    auto parse_count = [](const char* name, const char* v) -> std::optional<size_t> {
        try {
            size_t pos = 0;
            auto n = std::stoull(v, &pos);
            if (pos == std::strlen(v)) return static_cast<size_t>(n);
        } catch (const std::exception&) {
        }
        std::cerr << "Error: " << name << " expects a number, got \"" << v << "\"\n";
        return std::nullopt;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (!positional.empty() || arg.empty() || arg[0] != '-') {
            positional.push_back(arg);
            continue;
        }

        if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--option") {
            auto* v = next_arg(i, "--option");
            if (!v) return std::nullopt;
            std::string kv = v;
            auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Error: --option expects key=value, got \"" << kv << "\"\n";
                return std::nullopt;
            }
            config.storage_options.set(kv.substr(0, eq), kv.substr(eq + 1));
        } else if (arg == "--isolate-io") {
            config.isolate_io = true;
        } else if (arg == "--io-threads") {
            auto* v = next_arg(i, "--io-threads");
            if (!v) return std::nullopt;
            auto n = parse_count("--io-threads", v);
            if (!n) return std::nullopt;
            config.runtime.worker_threads = *n;
        } else if (arg == "--io-thread-name") {
            auto* v = next_arg(i, "--io-thread-name");
            if (!v) return std::nullopt;
            config.runtime.thread_name = v;
        } else if (arg == "--current-thread") {
            config.runtime.multi_threaded = false;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            auto* v = next_arg(i, "--metrics-interval");
            if (!v) return std::nullopt;
            auto n = parse_count("--metrics-interval", v);
            if (!n) return std::nullopt;
            config.metrics_interval_secs = *n;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (!positional.empty()) config.command = positional[0];
    if (positional.size() > 1) config.url = positional[1];
    if (positional.size() > 2) {
        config.args.assign(positional.begin() + 2, positional.end());
    }
    return config;
}

bool ToolConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("storage_options")) {
            // Overlay: keys from the file replace keys already set
            auto loaded = j["storage_options"].get<StorageOptions>();
            for (const auto& [key, value] : loaded.raw()) {
                storage_options.set(key, value);
            }
        }
        if (j.contains("runtime")) runtime = j["runtime"].get<RuntimeConfig>();
        if (j.contains("isolate_io")) isolate_io = j["isolate_io"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

std::string ToolConfig::validate() const {
    if (command.empty()) return "command is required";
    auto it = command_arity().find(command);
    if (it == command_arity().end()) return "unknown command: " + command;
    if (url.empty()) return "url is required";
    try {
        Url::parse(url);
    } catch (const StorageError& e) {
        return e.what();
    }
    auto [min_args, max_args] = it->second;
    if (args.size() < min_args || args.size() > max_args) {
        return command + " expects " + std::to_string(min_args) +
               (min_args == max_args ? "" : "-" + std::to_string(max_args)) +
               " argument(s) after the url, got " + std::to_string(args.size());
    }
    if (isolate_io && runtime.multi_threaded && runtime.worker_threads > 1024) {
        return "io_threads must be <= 1024";
    }
    if (!metrics_file.empty() && metrics_interval_secs == 0) {
        return "metrics_interval must be > 0";
    }
    return {};
}

} // namespace deltastore
