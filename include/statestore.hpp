#pragma once

#include <exception>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

class PersistenceException : public std::exception {
public:
    PersistenceException(std::string msg) : message(std::move(msg)) {}

    std::string message;

    const char* what() const noexcept override {
        return message.c_str();
    }
};

// The state file exists but cannot be trusted. Nothing may run on top of it.
class StateCorruptedException : public std::exception {
public:
    StateCorruptedException(std::string msg) : message(std::move(msg)) {}

    std::string message;

    const char* what() const noexcept override {
        return message.c_str();
    }
};

struct AppliedEntry {
    nlohmann::ordered_json prior_state;
    std::string applied_at;
    // The entry object as it was read, fields this version does not use
    // included. Null for entries created in this process.
    nlohmann::ordered_json stored;
};

/**
 * Tweak id -> captured prior state, in insertion order.
 *
 * Top-level keys that do not hold a well formed entry are kept as extras and
 * written back unchanged, so a record from another catalog version is never
 * silently trimmed.
 */
class AppliedRecord {
public:
    // Replaces an existing entry in place, keeping its unknown fields,
    // otherwise appends
    void Put(const std::string& id, AppliedEntry entry);
    bool Remove(const std::string& id);
    const AppliedEntry* Find(const std::string& id) const;

    bool Empty() const { return entries.empty(); }
    size_t Size() const { return entries.size(); }
    const std::vector<std::pair<std::string, AppliedEntry>>& Entries() const { return entries; }
    const nlohmann::ordered_json& Extras() const { return extras; }

    nlohmann::ordered_json ToJson() const;
    // Throws StateCorruptedException if j is not an object
    static AppliedRecord FromJson(const nlohmann::ordered_json& j);
private:
    std::vector<std::pair<std::string, AppliedEntry>> entries;
    nlohmann::ordered_json extras = nlohmann::ordered_json::object();
    // Every top-level key in file order, so saving does not reshuffle them
    std::vector<std::string> key_order;
};

class StateStore {
public:
    virtual ~StateStore() = default;

    // Throws StateCorruptedException if the stored record is unreadable
    virtual AppliedRecord Load() = 0;
    // Throws PersistenceException. Either the whole record is stored or
    // the previous one is left intact.
    virtual void Save(const AppliedRecord& record) = 0;
};

class FileStateStore : public StateStore {
public:
    explicit FileStateStore(std::filesystem::path path) : path(std::move(path)) {}

    AppliedRecord Load() override;
    void Save(const AppliedRecord& record) override;

    const std::filesystem::path& GetPath() const { return path; }
private:
    std::filesystem::path path;
};
