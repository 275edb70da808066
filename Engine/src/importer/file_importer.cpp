#include <importer/file_importer.hpp>
#include <fstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace Dagstore {

FileImporter::FileImporter(BlockStore& store, ImportConfig config)
    : store_(store), config_(std::move(config)) {
    if (config_.chunk_size == 0) {
        throw std::invalid_argument("ImportConfig: chunk_size must be greater than 0");
    }
}

ImportStats FileImporter::import(std::istream& in) {
    ImportStats stats;
    Batch batch(store_, config_.batch);
    std::unordered_set<Cid, CidHash> seen;

    std::vector<uint8_t> chunk(config_.chunk_size);
    while (in) {
        in.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        auto got = static_cast<size_t>(in.gcount());
        if (got == 0) break;

        RawNode node(std::vector<uint8_t>(chunk.begin(), chunk.begin() + got));
        Cid cid = batch.add(node);

        stats.bytes_read += got;
        stats.chunks++;
        if (seen.insert(cid).second) stats.unique_chunks++;
        stats.cids.push_back(cid);
    }
    if (in.bad()) {
        throw std::runtime_error("Read failed after " + std::to_string(stats.bytes_read) + " bytes");
    }

    batch.commit();
    return stats;
}

ImportStats FileImporter::import_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw std::runtime_error("Open failed: " + path);
    return import(file);
}

} // namespace Dagstore
