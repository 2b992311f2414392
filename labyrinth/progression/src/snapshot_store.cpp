#include <labyrinth/progression/snapshot_store.hpp>
#include <labyrinth/core/errors.hpp>
#include <labyrinth/core/log.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace labyrinth::progression {

namespace fs = std::filesystem;

// ============================================================================
// FileSnapshotStore
// ============================================================================

FileSnapshotStore::FileSnapshotStore(std::string directory)
    : m_directory(std::move(directory)) {}

std::string FileSnapshotStore::get_slot_path(const std::string& slot) const {
    return (fs::path(m_directory) / (slot + EXTENSION)).string();
}

void FileSnapshotStore::write(const std::string& slot, const std::string& data) {
    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
        throw core::PersistenceError("Failed to create save directory " + m_directory + ": " + ec.message());
    }

    std::string path = get_slot_path(slot);

    // Write to temp file first for atomic operation
    std::string temp_path = path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw core::PersistenceError("Failed to open " + temp_path + " for writing");
        }
        file << data;
        file.flush();
        if (!file.good()) {
            file.close();
            fs::remove(temp_path, ec);
            throw core::PersistenceError("Failed to write " + temp_path);
        }
    }

    // Atomic rename: replace target file with temp file
    fs::rename(temp_path, path, ec);
    if (ec) {
        core::log(core::LogLevel::Error, "[Snapshot] Failed to rename temp file: {}", ec.message());
        std::error_code remove_ec;
        fs::remove(temp_path, remove_ec);
        throw core::PersistenceError("Failed to replace " + path + ": " + ec.message());
    }

    core::log(core::LogLevel::Debug, "[Snapshot] Wrote slot '{}' ({} bytes)", slot, data.size());
}

std::optional<std::string> FileSnapshotStore::read(const std::string& slot) const {
    std::string path = get_slot_path(slot);
    if (!fs::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw core::PersistenceError("Failed to open " + path);
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw core::PersistenceError("Failed to read " + path);
    }
    return contents.str();
}

bool FileSnapshotStore::exists(const std::string& slot) const {
    std::error_code ec;
    return fs::is_regular_file(get_slot_path(slot), ec);
}

bool FileSnapshotStore::remove(const std::string& slot) {
    std::error_code ec;
    bool removed = fs::remove(get_slot_path(slot), ec);
    if (ec) {
        core::log(core::LogLevel::Warn, "[Snapshot] Failed to delete slot '{}': {}", slot, ec.message());
        return false;
    }
    return removed;
}

std::vector<std::string> FileSnapshotStore::list_slots() const {
    std::vector<std::string> slots;
    std::error_code ec;
    if (!fs::is_directory(m_directory, ec)) {
        return slots;
    }

    for (const auto& entry : fs::directory_iterator(m_directory, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == EXTENSION) {
            slots.push_back(entry.path().stem().string());
        }
    }
    std::sort(slots.begin(), slots.end());
    return slots;
}

// ============================================================================
// MemorySnapshotStore
// ============================================================================

void MemorySnapshotStore::write(const std::string& slot, const std::string& data) {
    if (m_fail_writes) {
        throw core::PersistenceError("Snapshot store rejected write to slot '" + slot + "'");
    }
    m_slots[slot] = data;
    ++m_write_count;
}

std::optional<std::string> MemorySnapshotStore::read(const std::string& slot) const {
    auto it = m_slots.find(slot);
    if (it == m_slots.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemorySnapshotStore::exists(const std::string& slot) const {
    return m_slots.contains(slot);
}

bool MemorySnapshotStore::remove(const std::string& slot) {
    return m_slots.erase(slot) > 0;
}

std::vector<std::string> MemorySnapshotStore::list_slots() const {
    std::vector<std::string> slots;
    for (const auto& [slot, data] : m_slots) {
        slots.push_back(slot);
    }
    return slots;
}

// ============================================================================
// Parsing
// ============================================================================

nlohmann::json parse_snapshot_text(const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw core::PersistenceError(std::string("Corrupt snapshot: ") + e.what());
    }
}

} // namespace labyrinth::progression
