#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace labyrinth::progression {

// ============================================================================
// ISnapshotStore - Named slots holding serialized progress
// ============================================================================
//
// Stores are byte oriented: they never interpret the text they hold.
// Failures throw core::PersistenceError.

class ISnapshotStore {
public:
    virtual ~ISnapshotStore() = default;

    virtual void write(const std::string& slot, const std::string& data) = 0;

    // nullopt when the slot has never been written
    virtual std::optional<std::string> read(const std::string& slot) const = 0;

    virtual bool exists(const std::string& slot) const = 0;
    virtual bool remove(const std::string& slot) = 0;
    virtual std::vector<std::string> list_slots() const = 0;
};

// ============================================================================
// FileSnapshotStore - One <slot>.json file per slot in a directory
// ============================================================================

class FileSnapshotStore : public ISnapshotStore {
public:
    static constexpr const char* EXTENSION = ".json";

    explicit FileSnapshotStore(std::string directory);

    // Written to <slot>.json.tmp, then renamed over the target
    void write(const std::string& slot, const std::string& data) override;
    std::optional<std::string> read(const std::string& slot) const override;
    bool exists(const std::string& slot) const override;
    bool remove(const std::string& slot) override;
    std::vector<std::string> list_slots() const override;

    std::string get_slot_path(const std::string& slot) const;
    const std::string& directory() const { return m_directory; }

private:
    std::string m_directory;
};

// ============================================================================
// MemorySnapshotStore - In-process slots (tests, embedding hosts)
// ============================================================================

class MemorySnapshotStore : public ISnapshotStore {
public:
    void write(const std::string& slot, const std::string& data) override;
    std::optional<std::string> read(const std::string& slot) const override;
    bool exists(const std::string& slot) const override;
    bool remove(const std::string& slot) override;
    std::vector<std::string> list_slots() const override;

    // Subsequent writes throw PersistenceError
    void set_fail_writes(bool fail) { m_fail_writes = fail; }
    size_t write_count() const { return m_write_count; }

private:
    std::map<std::string, std::string> m_slots;
    bool m_fail_writes = false;
    size_t m_write_count = 0;
};

// Parse stored text as a snapshot document, PersistenceError when malformed
nlohmann::json parse_snapshot_text(const std::string& text);

} // namespace labyrinth::progression
