// modules/checkpoint/checkpoint_storage.cpp
#include "modules/checkpoint/checkpoint_storage.h"
#include "common/utils/log.h"
#include "core/types/errors.h"
#include <fstream>
#include <sstream>
#include <system_error>

namespace blockflow {

namespace {

[[noreturn]] void throw_persistence(PersistenceError::Kind kind, const std::string& message) {
    throw OrchestrationError(PersistenceError{kind, message});
}

int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_millis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

Checkpoint metadata_from_json(const nlohmann::json& doc) {
    Checkpoint cp;
    cp.id = doc.at("id").get<std::string>();
    cp.sequence = doc.at("sequence").get<uint64_t>();
    cp.created_at = from_millis(doc.at("created_at").get<int64_t>());
    cp.reason = doc.value("reason", std::string{});
    cp.summary = doc.value("summary", std::string{});
    return cp;
}

std::string serialize(const CheckpointRecord& record) {
    try {
        return checkpoint_to_json(record).dump(2);
    } catch (const nlohmann::json::exception& e) {
        throw_persistence(PersistenceError::Kind::SERIALIZATION_ERROR,
                          "cannot serialize checkpoint " + record.checkpoint.id + ": " + e.what());
    }
}

nlohmann::json parse_document(const std::string& text, const std::string& origin) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw_persistence(PersistenceError::Kind::SERIALIZATION_ERROR,
                          "corrupt checkpoint " + origin + ": " + e.what());
    }
}

} // namespace

nlohmann::json checkpoint_to_json(const CheckpointRecord& record) {
    const auto& cp = record.checkpoint;
    return nlohmann::json{
        {"format_version", kCheckpointFormatVersion},
        {"id", cp.id},
        {"sequence", cp.sequence},
        {"created_at", to_millis(cp.created_at)},
        {"reason", cp.reason},
        {"summary", cp.summary},
        {"state", record.state},
        {"artifacts", record.artifacts}
    };
}

CheckpointRecord checkpoint_from_json(const nlohmann::json& doc) {
    try {
        const int version = doc.value("format_version", 0);
        if (version < 1 || version > kCheckpointFormatVersion) {
            throw_persistence(PersistenceError::Kind::SERIALIZATION_ERROR,
                              "unsupported checkpoint format_version " + std::to_string(version));
        }
        CheckpointRecord record;
        record.checkpoint = metadata_from_json(doc);
        record.state = doc.contains("state") ? doc["state"] : State::object();
        record.artifacts = doc.contains("artifacts") ? doc["artifacts"] : Value::object();
        return record;
    } catch (const nlohmann::json::exception& e) {
        throw_persistence(PersistenceError::Kind::SERIALIZATION_ERROR,
                          std::string("malformed checkpoint document: ") + e.what());
    }
}

// --- InMemoryCheckpointStorage ---

void InMemoryCheckpointStorage::write(const CheckpointRecord& record) {
    std::string doc = serialize(record);
    std::lock_guard<std::mutex> lock(mutex_);
    documents_[record.checkpoint.id] = std::move(doc);
}

std::optional<CheckpointRecord> InMemoryCheckpointStorage::read(const CheckpointId& id) {
    std::string doc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = documents_.find(id);
        if (it == documents_.end()) return std::nullopt;
        doc = it->second;
    }
    return checkpoint_from_json(parse_document(doc, id));
}

void InMemoryCheckpointStorage::remove(const CheckpointId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    documents_.erase(id);
}

std::vector<Checkpoint> InMemoryCheckpointStorage::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Checkpoint> result;
    result.reserve(documents_.size());
    for (const auto& [id, doc] : documents_) {
        result.push_back(checkpoint_from_json(parse_document(doc, id)).checkpoint);
    }
    return result;
}

// --- FileCheckpointStorage ---

FileCheckpointStorage::FileCheckpointStorage(std::filesystem::path directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw_persistence(PersistenceError::Kind::IO_ERROR,
                          "cannot create checkpoint directory " + directory_.string() + ": " + ec.message());
    }
}

std::filesystem::path FileCheckpointStorage::path_for(const CheckpointId& id) const {
    return directory_ / (id + ".json");
}

void FileCheckpointStorage::write(const CheckpointRecord& record) {
    const std::string doc = serialize(record);
    const auto target = path_for(record.checkpoint.id);
    auto tmp = target;
    tmp += ".tmp";

    std::lock_guard<std::mutex> lock(mutex_);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw_persistence(PersistenceError::Kind::IO_ERROR, "cannot open " + tmp.string() + " for writing");
        }
        out << doc;
        out.flush();
        if (!out) {
            throw_persistence(PersistenceError::Kind::IO_ERROR, "write failed for " + tmp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw_persistence(PersistenceError::Kind::IO_ERROR, "cannot move checkpoint into place: " + target.string());
    }
}

std::optional<CheckpointRecord> FileCheckpointStorage::read(const CheckpointId& id) {
    const auto path = path_for(id);
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw_persistence(PersistenceError::Kind::IO_ERROR, "cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return checkpoint_from_json(parse_document(buffer.str(), path.string()));
}

void FileCheckpointStorage::remove(const CheckpointId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(path_for(id), ec);
    if (ec) {
        throw_persistence(PersistenceError::Kind::IO_ERROR, "cannot delete checkpoint " + id + ": " + ec.message());
    }
}

std::vector<Checkpoint> FileCheckpointStorage::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Checkpoint> result;
    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(directory_, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension() != ".json") continue;

        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        try {
            result.push_back(checkpoint_from_json(parse_document(buffer.str(), path.string())).checkpoint);
        } catch (const OrchestrationError& e) {
            log_warning("Skipping unreadable checkpoint file " + path.string() + ": " + e.what());
        }
    }
    if (ec) {
        throw_persistence(PersistenceError::Kind::IO_ERROR,
                          "cannot list checkpoint directory " + directory_.string() + ": " + ec.message());
    }
    return result;
}

} // namespace blockflow
