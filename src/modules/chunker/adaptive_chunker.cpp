// modules/chunker/adaptive_chunker.cpp
#include "modules/chunker/adaptive_chunker.h"
#include "common/utils/log.h"
#include "core/types/errors.h"
#include <algorithm>
#include <stdexcept>

namespace blockflow {

AdaptiveChunker::AdaptiveChunker(Config config, std::shared_ptr<ResourceMonitor> monitor)
    : config_(config), monitor_(std::move(monitor)) {
    if (config_.min_size == 0 || config_.min_size > config_.max_size) {
        throw std::invalid_argument("chunking: min_size must be > 0 and <= max_size");
    }
    if (!(config_.factor > 0.0 && config_.factor < 1.0)) {
        throw std::invalid_argument("chunking: factor must be in (0, 1)");
    }
    current_size_ = std::clamp(config_.initial_size, config_.min_size, config_.max_size);
}

size_t AdaptiveChunker::calculate_chunk_size() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!monitor_) {
        return current_size_;
    }
    monitor_->update();
    const double usage = monitor_->memory_usage_percent();
    const double target = config_.target_memory_percent;
    const size_t before = current_size_;

    if (usage > target) {
        const auto shrunk = static_cast<size_t>(static_cast<double>(current_size_) * config_.factor);
        current_size_ = std::max(config_.min_size, shrunk);
    } else if (usage < target / 2.0) {
        const auto grown = static_cast<size_t>(static_cast<double>(current_size_) / config_.factor);
        current_size_ = std::min(config_.max_size, grown);
    }

    if (current_size_ != before) {
        log_debug("Chunk size " + std::to_string(before) + " -> " + std::to_string(current_size_) +
                  " (memory at " + std::to_string(usage) + "%)");
    }
    return current_size_;
}

size_t AdaptiveChunker::current_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_size_;
}

std::optional<size_t> AdaptiveChunker::find_boundary(std::string_view data, size_t from, size_t size) {
    if (size == 0) size = 1;
    if (from >= data.size() || data.size() - from <= size) {
        return std::nullopt;
    }
    const size_t newline = data.find('\n', from + size - 1);
    if (newline == std::string_view::npos) {
        return std::nullopt;
    }
    return newline + 1;
}

size_t AdaptiveChunker::overlap_start(std::string_view prev, size_t overlap) {
    const size_t bound = std::min(overlap, prev.size());
    size_t start = prev.size() - bound;
    if (start == 0 || prev[start - 1] == '\n') {
        return start;
    }
    const size_t newline = prev.find('\n', start);
    return newline == std::string_view::npos ? prev.size() : newline + 1;
}

std::vector<Chunk> AdaptiveChunker::chunk(std::string_view content) {
    const size_t size = calculate_chunk_size();
    std::vector<Chunk> chunks;

    if (content.empty()) {
        chunks.push_back(Chunk{});
        return chunks;
    }

    size_t pos = 0;        // start of data not yet emitted
    size_t prev_begin = 0; // new data of the previous chunk: [prev_begin, pos)
    while (pos < content.size()) {
        const size_t end = find_boundary(content, pos, size).value_or(content.size());

        size_t carried = 0;
        if (!chunks.empty()) {
            const std::string_view prev = content.substr(prev_begin, pos - prev_begin);
            carried = prev.size() - overlap_start(prev, config_.overlap);
        }

        Chunk c;
        c.index = chunks.size();
        c.offset = pos - carried;
        c.overlap = carried;
        c.content = std::string(content.substr(c.offset, end - c.offset));
        chunks.push_back(std::move(c));

        prev_begin = pos;
        pos = end;
    }
    return chunks;
}

void AdaptiveChunker::chunk_stream(std::istream& in, const std::function<void(Chunk)>& sink) {
    if (in.bad()) {
        throw OrchestrationError(PersistenceError{PersistenceError::Kind::IO_ERROR, "chunk input stream is unreadable"});
    }

    std::string buffer;       // carried overlap followed by pending data
    size_t carried = 0;       // overlap bytes at the front of buffer
    size_t offset = 0;        // input position of buffer[0]
    size_t index = 0;
    size_t size = calculate_chunk_size();
    std::vector<char> block(std::max<size_t>(config_.read_buffer, 1));

    auto emit = [&](size_t end) {
        Chunk c;
        c.index = index++;
        c.offset = offset;
        c.overlap = carried;
        c.content = buffer.substr(0, end);
        sink(std::move(c));
    };

    while (in.read(block.data(), static_cast<std::streamsize>(block.size())) || in.gcount() > 0) {
        buffer.append(block.data(), static_cast<size_t>(in.gcount()));

        while (auto end = find_boundary(buffer, carried, size)) {
            emit(*end);
            const std::string_view fresh = std::string_view(buffer).substr(carried, *end - carried);
            const size_t keep = fresh.size() - overlap_start(fresh, config_.overlap);
            const size_t drop = *end - keep;
            buffer.erase(0, drop);
            offset += drop;
            carried = keep;
            size = calculate_chunk_size();
        }
    }
    if (in.bad()) {
        throw OrchestrationError(PersistenceError{PersistenceError::Kind::IO_ERROR, "read error while chunking input"});
    }

    if (index == 0 || buffer.size() > carried) {
        emit(buffer.size());
    }
}

std::string AdaptiveChunker::reassemble(const std::vector<Chunk>& chunks) {
    std::string out;
    for (const auto& c : chunks) {
        out.append(c.content, std::min(c.overlap, c.content.size()), std::string::npos);
    }
    return out;
}

} // namespace blockflow
