#include "memocache.hpp"
#include "config.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "plugin.hpp"
#include <chrono>
#include <cstring>
#include <functional>
#include <iostream>
#include <string>

static void print_usage() {
    std::cout << "Usage: memocache-fib [options]\n"
              << "\n"
              << "Computes Fibonacci numbers with a memoized recursive function.\n"
              << "\n"
              << "Options:\n"
              << "  --n N                Compute fib(1) .. fib(N) (default: 1000)\n"
              << "  --ttl MS             Expire cached results after MS milliseconds\n"
              << "  --max-records N      Keep at most N cached results\n"
              << "  --mode MODE          Key mode: default or primitive\n"
              << "  --storage NAME       Storage backend (see below)\n"
              << "  --path FILE          File for file-backed storage\n"
              << "  --persist            Use the persistent backend\n"
              << "  --bench              Also time the plain recursive function\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Storage backends:";
    for (const auto& name : memocache::StorageRegistry::instance().names()) {
        std::cout << " " << name;
    }
    std::cout << "\n"
              << "\n"
              << "Environment variables:\n"
              << "  MEMOCACHE_CONFIG     Config file (default: ~/.memocache/config.json)\n"
              << "  MEMOCACHE_DEBUG      Trace cache operations to stderr\n";
}

static double plain_fib(int n) {
    return n <= 1 ? 1.0 : plain_fib(n - 1) + plain_fib(n - 2);
}

static double elapsed_ms(std::chrono::steady_clock::time_point start) {
    auto d = std::chrono::steady_clock::now() - start;
    return std::chrono::duration<double, std::milli>(d).count();
}

int main(int argc, char* argv[]) try {
    int n = 1000;
    std::string ttl;
    std::string max_records;
    std::string mode;
    std::string storage;
    std::string path;
    bool persist = false;
    bool bench = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--n") == 0 && i + 1 < argc) {
            n = std::stoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--ttl") == 0 && i + 1 < argc) {
            ttl = argv[++i];
        } else if (std::strcmp(argv[i], "--max-records") == 0 && i + 1 < argc) {
            max_records = argv[++i];
        } else if (std::strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            mode = argv[++i];
        } else if (std::strcmp(argv[i], "--storage") == 0 && i + 1 < argc) {
            storage = argv[++i];
        } else if (std::strcmp(argv[i], "--path") == 0 && i + 1 < argc) {
            path = argv[++i];
        } else if (std::strcmp(argv[i], "--persist") == 0) {
            persist = true;
        } else if (std::strcmp(argv[i], "--bench") == 0) {
            bench = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (n < 1) {
        std::cerr << "Error: --n must be at least 1\n";
        return 1;
    }

    auto config = memocache::Config::load();

    // Override config with CLI args
    if (persist) config.storage = memocache::Config::kPersistentBackend;
    if (!storage.empty()) config.storage = storage;
    if (!path.empty()) config.storage_path = path;

    nlohmann::json patch = {{"name", "fibonacci"}};
    if (!ttl.empty()) patch["ttl"] = ttl;
    if (!max_records.empty()) patch["max_records"] = max_records;
    if (!mode.empty()) patch["mode"] = mode;
    config.options = config.options.merged(patch);

    // The target calls back into the memoized function, so it needs a handle
    // to the memoizor it is wrapped in.
    std::function<double(int)> fib;
    auto memo = memocache::memoize_sync(
        [&fib](const memocache::Args& args) -> nlohmann::json {
            int k = args.at(0).get<int>();
            return k <= 1 ? 1.0 : fib(k - 1) + fib(k - 2);
        },
        config);
    fib = [&memo](int k) { return memo({k}).get<double>(); };

    uint64_t evicted = 0;
    memocache::subscribe<memocache::OverflowEvent>(memo.events(),
        [&evicted](const memocache::OverflowEvent& ev) { evicted += ev.keys.size(); });

    auto start = std::chrono::steady_clock::now();
    double result = 0;
    for (int i = 1; i <= n; i++) result = fib(i);
    double memo_ms = elapsed_ms(start);

    std::cout << "fib(" << n << ") = " << result << "\n"
              << "Total time (memoized, " << config.storage << "): " << memo_ms << "ms\n"
              << "Cached results: " << memo.store_contents().size() << "\n";
    if (evicted > 0) {
        std::cout << "Evicted: " << evicted << "\n";
    }

    if (bench) {
        // The plain version is exponential; keep it to a size that finishes.
        int plain_n = n < 32 ? n : 32;
        start = std::chrono::steady_clock::now();
        double plain = plain_fib(plain_n);
        std::cout << "Total time (plain fib(" << plain_n << ") = " << plain << "): "
                  << elapsed_ms(start) << "ms\n";
    }

    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
