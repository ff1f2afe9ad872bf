#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "glog/logging.h"
#include "cxxopts.hpp"

#include "common/configuration.h"
#include "region/database.h"
#include "region/range_map.h"

using namespace Strata;

namespace {

struct Mark {
    ScopeId scope;
    ByteRange range;
    LabelId label;
};

// Deterministic per-thread workload so --verify can rebuild it serially
std::vector<Mark> GenerateMarks(uint64_t seed, int thread, size_t count, uint64_t scopes,
                                uint32_t labels, uint32_t max_offset, uint32_t max_len) {
    std::mt19937_64 rng(seed * 1000003ULL + static_cast<uint64_t>(thread));
    std::uniform_int_distribution<uint64_t> scope_dist(0, scopes - 1);
    std::uniform_int_distribution<uint32_t> label_dist(0, labels - 1);
    std::uniform_int_distribution<uint32_t> start_dist(0, max_offset);
    std::uniform_int_distribution<uint32_t> len_dist(1, max_len);

    std::vector<Mark> marks;
    marks.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const uint32_t start = start_dist(rng);
        marks.push_back(Mark{scope_dist(rng), ByteRange{start, start + len_dist(rng)},
                             label_dist(rng)});
    }
    return marks;
}

double SecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // end of namespace

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    std::ios::sync_with_stdio(false);
    cxxopts::Options options("consolidate_bench", "Concurrent mark insert and finalize microbenchmark");
    options.add_options()
        ("config", "YAML configuration file", cxxopts::value<std::string>())
        ("threads", "Producer threads", cxxopts::value<int>()->default_value("8"))
        ("marks_per_thread", "Marks inserted by each producer", cxxopts::value<int>()->default_value("100000"))
        ("scopes", "Number of scopes marks are spread over", cxxopts::value<uint64_t>()->default_value("64"))
        ("labels", "Number of distinct labels", cxxopts::value<uint32_t>()->default_value("1000"))
        ("max_offset", "Largest mark start offset", cxxopts::value<uint32_t>()->default_value("1000000"))
        ("max_len", "Longest mark", cxxopts::value<uint32_t>()->default_value("512"))
        ("seed", "PRNG seed", cxxopts::value<uint64_t>()->default_value("1"))
        ("verify", "Compare every scope against an in-memory rebuild (0/1)", cxxopts::value<int>()->default_value("0"))
        ("csv_out", "Append a CSV summary line to this file", cxxopts::value<std::string>())
        ("help", "Print usage");

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    Configuration& config = Configuration::getInstance();
    if (result.count("config") && !config.loadFromFile(result["config"].as<std::string>())) {
        LOG(ERROR) << "Failed to load configuration";
        return 1;
    }
    if (!config.validate()) {
        for (const auto& error : config.getValidationErrors()) {
            LOG(ERROR) << "Invalid configuration: " << error;
        }
        return 1;
    }

    const int threads = result["threads"].as<int>();
    const size_t marks_per_thread = static_cast<size_t>(result["marks_per_thread"].as<int>());
    const uint64_t scopes = result["scopes"].as<uint64_t>();
    const uint32_t labels = result["labels"].as<uint32_t>();
    const uint32_t max_offset = result["max_offset"].as<uint32_t>();
    const uint32_t max_len = result["max_len"].as<uint32_t>();
    const uint64_t seed = result["seed"].as<uint64_t>();
    const bool verify = result["verify"].as<int>() != 0;
    if (threads <= 0 || scopes == 0 || labels == 0 || max_len == 0) {
        LOG(ERROR) << "threads, scopes, labels and max_len must be positive";
        return 1;
    }

    std::unique_ptr<Database> db;
    try {
        db = std::make_unique<Database>(DatabaseOptions::FromConfig(config));
    } catch (const std::exception& e) {
        LOG(ERROR) << "Failed to open database: " << e.what();
        return 1;
    }

    std::vector<std::vector<Mark>> workloads;
    workloads.reserve(static_cast<size_t>(threads));
    for (int t = 0; t < threads; ++t) {
        workloads.push_back(GenerateMarks(seed, t, marks_per_thread, scopes, labels, max_offset, max_len));
    }

    std::atomic<bool> insert_failed{false};
    const auto insert_start = std::chrono::steady_clock::now();
    std::vector<std::thread> producers;
    for (int t = 0; t < threads; ++t) {
        producers.emplace_back([&db, &workloads, &insert_failed, t]() {
            try {
                for (const Mark& mark : workloads[static_cast<size_t>(t)]) {
                    db->marks().Insert(mark.scope, mark.range, mark.label);
                }
            } catch (const StorageError& e) {
                LOG(ERROR) << "Producer " << t << " failed: " << e.what();
                insert_failed = true;
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }
    const double insert_s = SecondsSince(insert_start);
    if (insert_failed) {
        return 1;
    }

    const auto finalize_start = std::chrono::steady_clock::now();
    FinalizeReport report = db->compactor().FinalizeAll();
    const double finalize_s = SecondsSince(finalize_start);

    const size_t total_marks = static_cast<size_t>(threads) * marks_per_thread;
    std::cout << "inserted " << total_marks << " marks in " << insert_s << " s ("
              << (insert_s > 0 ? total_marks / insert_s : 0) << " marks/s)\n"
              << "finalized " << report.finalized.size() << " scopes into " << report.regions_written
              << " regions in " << finalize_s << " s, " << report.failed.size() << " failed"
              << std::endl;

    bool ok = report.ok();
    if (verify) {
        std::vector<RangeMap> expected(scopes);
        for (const auto& workload : workloads) {
            for (const Mark& mark : workload) {
                expected[mark.scope].Insert(mark.range, mark.label);
            }
        }
        for (ScopeId scope = 0; scope < scopes && ok; ++scope) {
            if (expected[scope].empty()) continue;
            if (db->regions().RegionsIn(scope) != expected[scope].Regions(scope)) {
                std::cout << "VERIFY FAIL: scope " << scope << " differs from in-memory rebuild" << std::endl;
                ok = false;
            }
        }
        std::cout << (ok ? "Verification PASSED" : "Verification FAILED") << std::endl;
    }

    if (result.count("csv_out")) {
        FILE* f = fopen(result["csv_out"].as<std::string>().c_str(), "a");
        if (f) {
            fprintf(f, "threads,%d,marks,%zu,scopes,%lu,labels,%u,insert_s,%.3f,finalize_s,%.3f,regions,%lu,failed,%zu\n",
                    threads, total_marks, static_cast<unsigned long>(scopes), labels, insert_s, finalize_s,
                    static_cast<unsigned long>(report.regions_written), report.failed.size());
            fclose(f);
        } else {
            LOG(WARNING) << "Could not open CSV output file";
        }
    }

    return ok ? 0 : 1;
}
