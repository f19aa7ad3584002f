#include "deltastore/core/log.hpp"
#include "deltastore/metrics/store_metrics.hpp"
#include "deltastore/storage/decorators.hpp"
#include "deltastore/storage/factory.hpp"
#include "deltastore/storage/io_runtime.hpp"
#include "deltastore/tool/tool_config.hpp"

#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>

namespace {

using namespace deltastore;

std::string format_time(std::chrono::system_clock::time_point tp) {
    time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_val;
    gmtime_r(&t, &tm_val);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_val);
    return buf;
}

void print_meta(const ObjectMeta& meta) {
    std::cout << meta.size << "\t" << format_time(meta.last_modified) << "\t"
              << meta.location << "\n";
}

// Location inside the store: the URL's root joined with a user-supplied key
Path resolve_key(const Path& root, const std::string& key) {
    return root.join(Path::parse(key));
}

int report(const Status& status) {
    if (status.success) return 0;
    std::cerr << "Error (" << to_string(status.error) << "): " << status.error_message << "\n";
    return 1;
}

// Find the LimitStore in a decorator chain, if any
const LimitStore* find_limit(const ObjectStoreRef& store) {
    ObjectStore* current = store.get();
    while (current) {
        if (auto* limit = dynamic_cast<LimitStore*>(current)) return limit;
        if (auto* prefix = dynamic_cast<PrefixStore*>(current)) {
            current = prefix->inner().get();
        } else if (auto* isolated = dynamic_cast<DeltaIOStorageBackend*>(current)) {
            current = isolated->inner().get();
        } else {
            break;
        }
    }
    return nullptr;
}

int run_command(const ToolConfig& config, ObjectStore& store, const Path& root) {
    const auto& cmd = config.command;
    const auto& args = config.args;

    if (cmd == "ls") {
        std::optional<Path> prefix = root;
        if (!args.empty()) prefix = resolve_key(root, args[0]);
        if (prefix->is_root()) prefix.reset();

        auto result = list_all(store, prefix);
        if (!result.success) return report(result);
        for (const auto& meta : result.objects) print_meta(meta);
        return 0;
    }

    if (cmd == "lsd") {
        std::optional<Path> prefix = root;
        if (!args.empty()) prefix = resolve_key(root, args[0]);
        if (prefix->is_root()) prefix.reset();

        auto result = store.list_with_delimiter(prefix);
        if (!result.success) return report(result);
        for (const auto& common : result.common_prefixes) {
            std::cout << "PRE\t" << common << "/\n";
        }
        for (const auto& meta : result.objects) print_meta(meta);
        return 0;
    }

    if (cmd == "cat") {
        auto result = store.get(resolve_key(root, args[0]));
        if (!result.success) return report(result);
        std::cout.write(reinterpret_cast<const char*>(result.data.data()),
                        static_cast<std::streamsize>(result.data.size()));
        return std::cout.good() ? 0 : 1;
    }

    if (cmd == "head") {
        auto result = store.head(resolve_key(root, args[0]));
        if (!result.success) return report(result);
        std::cout << "location: " << result.meta.location << "\n"
                  << "size: " << result.meta.size << "\n"
                  << "last_modified: " << format_time(result.meta.last_modified) << "\n"
                  << "e_tag: " << result.meta.e_tag.value_or("-") << "\n";
        return 0;
    }

    if (cmd == "put") {
        std::ifstream in(args[1], std::ios::binary);
        if (!in) {
            std::cerr << "Error: cannot open " << args[1] << "\n";
            return 1;
        }
        Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        auto location = resolve_key(root, args[0]);
        auto result = store.put(location, data);
        if (!result.success) return report(result);
        std::cout << "put " << location << " (" << data.size() << " bytes, e_tag "
                  << result.e_tag.value_or("-") << ")\n";
        return 0;
    }

    if (cmd == "rm") {
        return report(store.remove(resolve_key(root, args[0])));
    }

    if (cmd == "cp") {
        return report(store.copy(resolve_key(root, args[0]), resolve_key(root, args[1])));
    }

    if (cmd == "mv") {
        return report(store.rename(resolve_key(root, args[0]), resolve_key(root, args[1])));
    }

    std::cerr << "Error: unknown command: " << cmd << "\n";
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = ToolConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        ToolConfig::print_usage();
        return 1;
    }

    set_log_verbose(config.verbose);

    if (config.command == "commit-path") {
        try {
            size_t pos = 0;
            long long version = std::stoll(config.args[0], &pos);
            if (pos != config.args[0].size() || version < 0) throw std::invalid_argument("version");
            std::cout << commit_uri_from_version(version) << "\n";
            return 0;
        } catch (const std::exception&) {
            std::cerr << "Error: invalid version: " << config.args[0] << "\n";
            return 1;
        }
    }

    try {
        auto url = Url::parse(config.url);
        auto [store, root] = factories().parse_url_opts(url, config.storage_options);
        log_debug("Using %s for %s", store->to_string().c_str(), url.to_string().c_str());

        // memory:// stores already apply the URL path as a prefix
        if (url.scheme == "memory") root = Path();

        RuntimeHandle runtime;
        if (config.isolate_io) {
            runtime = std::make_shared<IoRuntime>(config.runtime);
            store = isolate_io(store, IORuntime(runtime));
        }

        std::shared_ptr<StoreMetrics> metrics;
        std::unique_ptr<MetricsExporter> exporter;
        if (!config.metrics_file.empty()) {
            metrics = std::make_shared<StoreMetrics>(
                std::map<std::string, std::string>{{"scheme", url.scheme}});
            exporter = std::make_unique<MetricsExporter>(
                config.metrics_file, std::chrono::seconds(config.metrics_interval_secs), metrics);
            exporter->set_runtime(runtime.get());
            exporter->set_limit_store(find_limit(store));
            store = std::make_shared<InstrumentedStore>(store, metrics);
            exporter->start();
        }

        int rc = run_command(config, *store, root);

        if (exporter) exporter->stop();
        if (runtime) runtime->shutdown();
        return rc;
    } catch (const StorageError& e) {
        std::cerr << "Error (" << to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        log_error("%s failed: %s", config.command.c_str(), e.what());
        return 1;
    }
}
