// modules/chunker/adaptive_chunker.h
#ifndef BLOCKFLOW_MODULES_CHUNKER_ADAPTIVE_CHUNKER_H
#define BLOCKFLOW_MODULES_CHUNKER_ADAPTIVE_CHUNKER_H

#include "modules/resource/resource_monitor.h"
#include <cstddef>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blockflow {

struct Chunk {
    std::string content;   // includes the overlap prefix
    size_t index = 0;
    size_t offset = 0;     // position of content[0] in the input
    size_t overlap = 0;    // leading bytes repeated from the previous chunk
};

/**
 * Splits large text on line boundaries. The chunk size follows memory
 * pressure reported by the resource monitor and is remembered across calls.
 */
class AdaptiveChunker {
public:
    struct Config {
        size_t initial_size = 4096;
        size_t min_size = 512;
        size_t max_size = 65536;
        size_t overlap = 256;
        double factor = 0.5;                 // shrink multiplier, grow divides by it
        double target_memory_percent = 80.0; // of the configured memory limit
        size_t read_buffer = 4096;           // streaming read block
        Config() = default;
    };

    // monitor may be null; the size then stays at initial_size
    AdaptiveChunker(Config config, std::shared_ptr<ResourceMonitor> monitor);

    size_t calculate_chunk_size();
    size_t current_size() const;

    std::vector<Chunk> chunk(std::string_view content);

    // Reads until end of input, handing each chunk to sink as soon as it is complete.
    void chunk_stream(std::istream& in, const std::function<void(Chunk)>& sink);

    static std::string reassemble(const std::vector<Chunk>& chunks);

    // End offset (exclusive) of a chunk whose new data starts at `from`:
    // the first line end at or after from + size. nullopt when the rest is taken whole.
    static std::optional<size_t> find_boundary(std::string_view data, size_t from, size_t size);

    // Offset inside `prev` where the carried overlap starts, aligned to a line start.
    static size_t overlap_start(std::string_view prev, size_t overlap);

private:
    const Config config_;
    std::shared_ptr<ResourceMonitor> monitor_;
    mutable std::mutex mutex_;
    size_t current_size_;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_CHUNKER_ADAPTIVE_CHUNKER_H
