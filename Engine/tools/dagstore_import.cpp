#include <importer/file_importer.hpp>
#include <storage/memory_block_store.hpp>
#include <storage/postgres_block_store.hpp>
#include <utils/logger.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

using namespace Dagstore;

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <file> [options]\n"
              << "\nOptions:\n"
              << "  --config <batch.json>   max_bytes / max_blocks / max_parallel\n"
              << "  --chunk-size <bytes>    fixed chunk size (default 262144)\n"
              << "  --memory                store in memory instead of PostgreSQL\n"
              << "  --verbose               print one cid per chunk\n"
              << "\nPostgreSQL is reached through PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD.\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string path;
    std::string config_path;
    ImportConfig config;
    bool in_memory = false;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--chunk-size" && i + 1 < argc) {
                config.chunk_size = std::stoull(argv[++i]);
            } else if (arg == "--memory") {
                in_memory = true;
            } else if (arg == "--verbose") {
                verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                usage(argv[0]);
                return 0;
            } else if (path.empty() && arg.rfind("--", 0) != 0) {
                path = arg;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                usage(argv[0]);
                return 1;
            }
        }
        if (path.empty()) {
            usage(argv[0]);
            return 1;
        }

        if (!config_path.empty()) {
            config.batch = load_batch_config(config_path);
        }

        std::unique_ptr<BlockStore> store;
        if (in_memory) {
            store = std::make_unique<MemoryBlockStore>();
        } else {
            auto pg = std::make_unique<PostgresBlockStore>();
            pg->ensure_schema();
            store = std::move(pg);
        }

        Logger::step("Importing " + path);
        Logger::info("chunk_size=" + std::to_string(config.chunk_size) +
                     " max_bytes=" + std::to_string(config.batch.max_bytes) +
                     " max_blocks=" + std::to_string(config.batch.max_blocks) +
                     " max_parallel=" + std::to_string(config.batch.max_parallel));

        auto start = std::chrono::steady_clock::now();
        FileImporter importer(*store, config);
        ImportStats stats = importer.import_file(path);
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        if (verbose) {
            for (size_t i = 0; i < stats.cids.size(); ++i) {
                std::cout << i << "\t" << cid_to_string(stats.cids[i]) << "\n";
            }
        }

        std::cout << "\n=== Import Complete ===\n"
                  << "Input: " << stats.bytes_read << " bytes\n"
                  << "Chunks: " << stats.chunks << " (" << stats.unique_chunks << " unique)\n"
                  << "Elapsed: " << elapsed << " s\n";
        if (elapsed > 0) {
            std::cout << "Throughput: " << (stats.bytes_read / elapsed / (1024.0 * 1024.0)) << " MiB/s\n";
        }

        Logger::success("Committed " + std::to_string(stats.chunks) + " chunks");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
