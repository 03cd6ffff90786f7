#include "statestore.hpp"
#include "log.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <system_error>

using json = nlohmann::ordered_json;
namespace fs = std::filesystem;

namespace {
    bool IsEntry(const json& value) {
        return value.is_object()
            && value.contains("priorState")
            && value.contains("appliedAt")
            && value.at("appliedAt").is_string();
    }
}

void AppliedRecord::Put(const std::string& id, AppliedEntry entry) {
    extras.erase(id);

    for (auto& existing : entries) {
        if (existing.first == id) {
            if (entry.stored.is_null()) entry.stored = std::move(existing.second.stored);
            existing.second = std::move(entry);
            return;
        }
    }

    entries.emplace_back(id, std::move(entry));
    if (std::find(key_order.begin(), key_order.end(), id) == key_order.end()) {
        key_order.push_back(id);
    }
}

bool AppliedRecord::Remove(const std::string& id) {
    auto it = std::find_if(entries.begin(), entries.end(), [&](const auto& e) { return e.first == id; });
    if (it == entries.end()) return false;

    entries.erase(it);
    key_order.erase(std::remove(key_order.begin(), key_order.end(), id), key_order.end());
    return true;
}

const AppliedEntry* AppliedRecord::Find(const std::string& id) const {
    for (const auto& entry : entries) {
        if (entry.first == id) return &entry.second;
    }
    return nullptr;
}

json AppliedRecord::ToJson() const {
    json j = json::object();
    for (const auto& key : key_order) {
        if (auto entry = Find(key)) {
            json value = entry->stored.is_object() ? entry->stored : json::object();
            value["priorState"] = entry->prior_state;
            value["appliedAt"] = entry->applied_at;
            j[key] = std::move(value);
        } else if (extras.contains(key)) {
            j[key] = extras.at(key);
        }
    }
    return j;
}

AppliedRecord AppliedRecord::FromJson(const json& j) {
    if (!j.is_object())
        throw StateCorruptedException(std::format("Expected a JSON object, found {}", j.type_name()));

    AppliedRecord record;
    for (const auto& [key, value] : j.items()) {
        record.key_order.push_back(key);
        if (IsEntry(value)) {
            record.entries.emplace_back(key, AppliedEntry {
                .prior_state = value.at("priorState"),
                .applied_at = value.at("appliedAt").get<std::string>(),
                .stored = value
            });
        } else {
            record.extras[key] = value;
        }
    }
    return record;
}

AppliedRecord FileStateStore::Load() {
    std::error_code ec;
    bool exists = fs::exists(path, ec);
    if (ec)
        throw StateCorruptedException(std::format("Cannot access state file {}: {}", path.string(), ec.message()));
    if (!exists) {
        Log::Debug("FileStateStore::Load", "No state file at {}, starting empty", path.string());
        return AppliedRecord();
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open())
        throw StateCorruptedException(std::format("Cannot open state file {}", path.string()));

    json j;
    try {
        j = json::parse(stream);
    } catch (const json::parse_error& ex) {
        throw StateCorruptedException(std::format("State file {} is not valid JSON: {}", path.string(), ex.what()));
    }

    auto record = AppliedRecord::FromJson(j);
    for (const auto& [key, _] : record.Extras().items()) {
        Log::Warning("FileStateStore::Load", "Keeping unrecognised entry '{}' in {}", key, path.string());
    }
    Log::Debug("FileStateStore::Load", "Loaded {} applied tweaks", record.Size());
    return record;
}

void FileStateStore::Save(const AppliedRecord& record) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec)
            throw PersistenceException(std::format("Cannot create {}: {}", path.parent_path().string(), ec.message()));
    }

    std::string s = record.ToJson().dump(4);
    fs::path tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream stream(tmp_path, std::ios::binary | std::ios::trunc);
        if (!stream.is_open())
            throw PersistenceException(std::format("Cannot write {}", tmp_path.string()));

        stream.write(s.data(), s.size());
        stream.flush();
        if (!stream.good()) {
            stream.close();
            fs::remove(tmp_path, ec);
            throw PersistenceException(std::format("Failed writing {}", tmp_path.string()));
        }
    }

    fs::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw PersistenceException(std::format("Cannot replace {}: {}", path.string(), ec.message()));
    }

    Log::Debug("FileStateStore::Save", "Saved {} applied tweaks to {}", record.Size(), path.string());
}
