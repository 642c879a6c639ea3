#include "bench_config.hpp"
#include "trackmap/bounded_table.hpp"
#include "trackmap/memory_store.hpp"
#include "trackmap/s3_settings.hpp"
#include "trackmap/s3_store.hpp"
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <thread>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>

struct Stats {
    std::atomic<int> num_puts{0};
    std::atomic<int> num_conditional{0};
    std::atomic<int> num_inserted{0};
    std::atomic<int> num_failures{0};
    std::atomic<std::uint64_t> evict_notifications{0};
};

void worker_thread(trackmap::BoundedTrackingTable& table,
                   const BenchConfig& cfg,
                   Stats& stats,
                   int thread_id) {
    const trackmap::Bytes payload(cfg.payload_bytes, static_cast<std::uint8_t>(thread_id));
    int ids_per_thread = cfg.num_ids / cfg.num_threads;
    int conditional_every = cfg.conditional_ratio > 0.0
        ? static_cast<int>(1.0 / cfg.conditional_ratio) : 0;

    for (int i = 0; i < ids_per_thread; ++i) {
        std::string id = "task-" + std::to_string(thread_id) + "-" + std::to_string(i);
        try {
            if (conditional_every > 0 && i % conditional_every == 0) {
                stats.num_conditional++;
                if (table.PutIfAbsent(id, payload)) {
                    stats.num_inserted++;
                }
            } else {
                stats.num_puts++;
                table.Put(id, payload);
                stats.num_inserted++;
            }
        } catch (const std::exception& e) {
            stats.num_failures++;
            spdlog::error("thread {}: insert of {} failed: {}", thread_id, id, e.what());
        }
    }
}

int main(int argc, char** argv) {
    cxxopts::Options options("trackbench", "Load generator for BoundedTrackingTable");
    options.add_options()
        ("t,threads", "Number of worker threads", cxxopts::value<int>()->default_value("4"))
        ("n,ids", "Total number of tracking ids to insert", cxxopts::value<int>()->default_value("10000"))
        ("m,max-size", "Maximum table size", cxxopts::value<std::int64_t>()->default_value("1000"))
        ("d,dir", "Tracking directory", cxxopts::value<std::string>()->default_value(""))
        ("payload-bytes", "Payload size per entry", cxxopts::value<int>()->default_value("64"))
        ("c,conditional-ratio", "Share of inserts done with PutIfAbsent (0.0 to 1.0)",
            cxxopts::value<double>()->default_value("0.5"))
        ("s3", "Use the S3 store (configured from TRK_* environment variables)")
        ("l,log-level", "trace, debug, info, warn, error", cxxopts::value<std::string>()->default_value("info"))
        ("h,help", "Print usage");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      std::cout << options.help() << std::endl;
      return 0;
    }

    spdlog::set_level(spdlog::level::from_str(result["log-level"].as<std::string>()));

    BenchConfig cfg;
    cfg.num_threads = result["threads"].as<int>();
    cfg.num_ids = result["ids"].as<int>();
    cfg.max_size = result["max-size"].as<std::int64_t>();
    cfg.payload_bytes = result["payload-bytes"].as<int>();
    cfg.conditional_ratio = result["conditional-ratio"].as<double>();
    cfg.use_s3 = result.count("s3") > 0;

    std::string invalid = ValidateBenchConfig(cfg);
    if (!invalid.empty()) {
        std::cerr << invalid << std::endl;
        return 1;
    }

    trackmap::Config table_cfg;
    table_cfg.tracking_dir = result["dir"].as<std::string>();
    table_cfg.max_size = cfg.max_size;
    trackmap::ApplyTableConfigDefaults(table_cfg);

    spdlog::info("threads={} ids={} max_size={} dir={} store={}", cfg.num_threads, cfg.num_ids,
                 table_cfg.max_size, table_cfg.tracking_dir, cfg.use_s3 ? "s3" : "memory");

    std::unique_ptr<trackmap::CoordinationStore> store;
    if (cfg.use_s3) {
        trackmap::ApplyS3ConfigDefaults(table_cfg);
        store = std::make_unique<trackmap::S3CoordinationStore>(table_cfg);
    } else {
        store = std::make_unique<trackmap::MemoryCoordinationStore>();
    }

    Stats stats;
    std::unique_ptr<trackmap::BoundedTrackingTable> table;
    try {
        table = std::make_unique<trackmap::BoundedTrackingTable>(
            *store, table_cfg.tracking_dir, table_cfg.max_size,
            [&stats](const std::string&) { stats.evict_notifications++; });
    } catch (const std::exception& e) {
        std::cerr << "Cannot open tracking table: " << e.what() << std::endl;
        return 1;
    }

    std::vector<std::thread> threads;
    auto start_time = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < cfg.num_threads; ++i) {
        threads.emplace_back(worker_thread, std::ref(*table), std::cref(cfg), std::ref(stats), i);
    }

    for (auto& t : threads) {
        t.join();
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    double total_duration_s = std::chrono::duration<double>(end_time - start_time).count();
    int total_ops = stats.num_puts + stats.num_conditional;

    std::size_t final_size = table->Size();
    // Each thread may be one insert past the pre-insertion check it ran. Concurrent passes
    // can overlap, so this is a soft bound.
    bool within_bound = table->CleanupCount() == 0 ||
        static_cast<std::int64_t>(final_size) <= table_cfg.max_size + cfg.num_threads;

    std::cout << "----------- Results -----------" << std::endl;
    std::cout << "Total duration: " << total_duration_s << " s" << std::endl;
    std::cout << "Operations per second: " << (total_duration_s > 0 ? total_ops / total_duration_s : 0.0) << std::endl;
    std::cout << "Put operations: " << stats.num_puts << std::endl;
    std::cout << "PutIfAbsent operations: " << stats.num_conditional << std::endl;
    std::cout << "Entries inserted: " << stats.num_inserted << std::endl;
    std::cout << "Failed operations: " << stats.num_failures << std::endl;
    std::cout << "Entries evicted: " << table->EvictedCount() << std::endl;
    std::cout << "Overflow notifications: " << stats.evict_notifications << std::endl;
    std::cout << "Final size: " << final_size << " (max " << table_cfg.max_size << ")" << std::endl;
    std::cout << "-----------------------------" << std::endl;

    if (!within_bound) {
        spdlog::warn("final size {} is above max_size + threads", final_size);
    }
    return stats.num_failures > 0 ? 1 : 0;
}
