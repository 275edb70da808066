/**
 * @file file_importer.hpp
 * @brief Chunks byte streams into raw blocks and stores them through a Batch
 */

#pragma once

#include <dag/batch.hpp>
#include <storage/block_store.hpp>
#include <istream>
#include <string>
#include <vector>

namespace Dagstore {

/**
 * @brief Import statistics
 */
struct ImportStats {
    uint64_t bytes_read = 0;
    size_t chunks = 0;
    size_t unique_chunks = 0;
    std::vector<Cid> cids;  // one per chunk, in stream order
};

/**
 * @brief Import configuration
 */
struct ImportConfig {
    size_t chunk_size = 256 * 1024;  // Fixed-size chunking
    BatchConfig batch;
};

/**
 * @brief Fixed-size chunking importer
 *
 * Every chunk becomes a RawNode added to one Batch; the batch is committed at
 * the end of the stream. Batch errors propagate unchanged.
 */
class FileImporter {
public:
    /**
     * @throws std::invalid_argument if chunk_size is 0
     */
    FileImporter(BlockStore& store, ImportConfig config = {});

    ImportStats import(std::istream& in);
    ImportStats import_file(const std::string& path);

private:
    BlockStore& store_;
    ImportConfig config_;
};

} // namespace Dagstore
