#pragma once

#include "catalog.hpp"
#include "executor.hpp"
#include "privilege.hpp"
#include "statestore.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

// A batch was started from inside a result observer of another batch
class EngineException : public std::exception {
public:
    EngineException(std::string msg) : message(std::move(msg)) {}

    std::string message;

    const char* what() const noexcept override {
        return message.c_str();
    }
};

enum class Outcome {
    Applied,
    Restored,
    SkippedInsufficientPrivilege,
    Failed,
    NotFound
};

enum class FailureKind {
    None,
    Execution,
    UnknownTweak,
    Persistence
};

const char* OutcomeName(Outcome outcome);
const char* FailureKindName(FailureKind kind);

struct TweakResult {
    std::string id;
    Outcome outcome = Outcome::Failed;
    FailureKind failure = FailureKind::None;
    std::string reason;
};

struct RestoreReport {
    bool nothing_to_restore = false;
    std::vector<TweakResult> results;
};

struct TweakStatus {
    const Tweak* tweak = nullptr;
    bool applied = false;
    std::string applied_at;
};

struct EngineStatus {
    std::vector<TweakStatus> tweaks;
    // Recorded ids the catalog no longer defines
    std::vector<std::string> stale_ids;
    nlohmann::ordered_json extras;
};

using ResultObserver = std::function<void(const TweakResult&)>;

/**
 * Applies and restores catalog tweaks, one at a time, keeping the applied
 * record in the StateStore in step with what was actually changed.
 *
 * The record is loaded at the start of every batch and saved after every
 * successful change, so a crash mid batch never leaves an applied reversible
 * tweak unrecorded. Batches are serialised; a second caller blocks until the
 * running batch finishes. Observers may call Status, but starting another
 * batch from an observer throws EngineException.
 */
class TweakEngine {
public:
    TweakEngine(const TweakCatalog& catalog, ActionExecutor& executor, StateStore& store, const PrivilegeGate& privileges);

    // Throws StateCorruptedException if the record cannot be loaded.
    // A stop request is honoured between tweaks, never during one.
    std::vector<TweakResult> Apply(const std::vector<std::string>& ids, ResultObserver observer = nullptr, std::stop_token stop = {});

    // Throws StateCorruptedException if the record cannot be loaded
    RestoreReport Restore(ResultObserver observer = nullptr, std::stop_token stop = {});

    // Reads the last saved record without waiting for a running batch.
    // Throws StateCorruptedException if the record cannot be loaded
    EngineStatus Status();

    static std::string Timestamp();
private:
    const TweakCatalog& catalog;
    ActionExecutor& executor;
    StateStore& store;
    const PrivilegeGate& privileges;
    std::mutex batch_mutex;
    // Thread running the current batch, default id when idle
    std::atomic<std::thread::id> batch_thread;

    void CheckNotInBatch() const;
};
