#include "engine.hpp"
#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <unordered_set>

const char* OutcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::Applied: return "Applied";
        case Outcome::Restored: return "Restored";
        case Outcome::SkippedInsufficientPrivilege: return "SkippedInsufficientPrivilege";
        case Outcome::Failed: return "Failed";
        case Outcome::NotFound: return "NotFound";
    }
    return "Unknown";
}

const char* FailureKindName(FailureKind kind) {
    switch (kind) {
        case FailureKind::None: return "None";
        case FailureKind::Execution: return "ExecutionFailure";
        case FailureKind::UnknownTweak: return "UnknownTweak";
        case FailureKind::Persistence: return "PersistenceFailure";
    }
    return "Unknown";
}

namespace {
    TweakResult Result(const std::string& id, Outcome outcome, FailureKind failure = FailureKind::None, std::string reason = "") {
        return TweakResult { .id = id, .outcome = outcome, .failure = failure, .reason = std::move(reason) };
    }

    void Report(std::vector<TweakResult>& results, const ResultObserver& observer, TweakResult result) {
        if (result.outcome == Outcome::Failed) {
            Log::Error("TweakEngine", "{}: {} ({})", result.id, FailureKindName(result.failure), result.reason);
        } else {
            Log::Info("TweakEngine", "{}: {}", result.id, OutcomeName(result.outcome));
        }

        results.push_back(std::move(result));
        if (observer) observer(results.back());
    }

    const char* NOT_ATTEMPTED = "Not attempted, the state file could not be written";

    // Marks the calling thread as the batch owner until the scope ends
    class BatchOwner {
    public:
        explicit BatchOwner(std::atomic<std::thread::id>& slot) : owner(slot) {
            owner = std::this_thread::get_id();
        }
        ~BatchOwner() {
            owner = std::thread::id();
        }
        BatchOwner(const BatchOwner&) = delete;
        BatchOwner& operator=(const BatchOwner&) = delete;
    private:
        std::atomic<std::thread::id>& owner;
    };
}

TweakEngine::TweakEngine(const TweakCatalog& catalog, ActionExecutor& executor, StateStore& store, const PrivilegeGate& privileges)
    : catalog(catalog), executor(executor), store(store), privileges(privileges) {}

void TweakEngine::CheckNotInBatch() const {
    if (batch_thread.load() == std::this_thread::get_id())
        throw EngineException("Cannot start a batch from inside a result observer");
}

std::string TweakEngine::Timestamp() {
    return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
}

std::vector<TweakResult> TweakEngine::Apply(const std::vector<std::string>& ids, ResultObserver observer, std::stop_token stop) {
    CheckNotInBatch();
    std::lock_guard lock(batch_mutex);
    BatchOwner owner(batch_thread);

    AppliedRecord record = store.Load();

    // Known ids run in catalog order, unknown ones follow in selection order
    std::vector<std::string> known;
    std::vector<std::string> unknown;
    std::unordered_set<std::string> seen;
    for (const auto& id : ids) {
        if (!seen.insert(id).second) continue;
        if (catalog.IndexOf(id).has_value()) {
            known.push_back(id);
        } else {
            unknown.push_back(id);
        }
    }
    std::sort(known.begin(), known.end(), [this](const std::string& a, const std::string& b) {
        return *catalog.IndexOf(a) < *catalog.IndexOf(b);
    });

    std::vector<std::string> order = known;
    order.insert(order.end(), unknown.begin(), unknown.end());

    Log::Info("TweakEngine::Apply", "Applying {} tweak(s)", order.size());

    std::vector<TweakResult> results;
    for (size_t i = 0; i < order.size(); i++) {
        const auto& id = order[i];

        if (stop.stop_requested()) {
            Log::Info("TweakEngine::Apply", "Stopped before {}, {} tweak(s) not started", id, order.size() - i);
            break;
        }

        const Tweak* tweak = catalog.Find(id);
        if (tweak == nullptr) {
            Report(results, observer, Result(id, Outcome::NotFound, FailureKind::UnknownTweak, "Not in the catalog"));
            continue;
        }

        if (tweak->requires_elevation && !privileges.IsElevated()) {
            Report(results, observer, Result(id, Outcome::SkippedInsufficientPrivilege));
            continue;
        }

        PriorState prior;
        try {
            prior = tweak->apply(executor);
        } catch (const std::exception& ex) {
            Report(results, observer, Result(id, Outcome::Failed, FailureKind::Execution, ex.what()));
            continue;
        }

        if (tweak->reversible) {
            record.Put(id, AppliedEntry { .prior_state = std::move(prior), .applied_at = Timestamp() });
            try {
                store.Save(record);
            } catch (const PersistenceException& ex) {
                Report(results, observer, Result(id, Outcome::Failed, FailureKind::Persistence,
                    std::format("Applied but not recorded: {}", ex.message)));

                for (size_t j = i + 1; j < order.size(); j++) {
                    Report(results, observer, Result(order[j], Outcome::Failed, FailureKind::Persistence, NOT_ATTEMPTED));
                }
                break;
            }
        }

        Report(results, observer, Result(id, Outcome::Applied));
    }

    return results;
}

RestoreReport TweakEngine::Restore(ResultObserver observer, std::stop_token stop) {
    CheckNotInBatch();
    std::lock_guard lock(batch_mutex);
    BatchOwner owner(batch_thread);

    AppliedRecord record = store.Load();
    RestoreReport report;

    if (record.Empty()) {
        Log::Info("TweakEngine::Restore", "Nothing to restore");
        report.nothing_to_restore = true;
        return report;
    }

    // Copy, the record shrinks as entries are undone
    auto entries = record.Entries();
    Log::Info("TweakEngine::Restore", "Restoring {} tweak(s)", entries.size());

    for (size_t i = 0; i < entries.size(); i++) {
        const auto& [id, entry] = entries[i];

        if (stop.stop_requested()) {
            Log::Info("TweakEngine::Restore", "Stopped before {}, {} tweak(s) not started", id, entries.size() - i);
            break;
        }

        const Tweak* tweak = catalog.Find(id);
        if (tweak == nullptr) {
            Report(report.results, observer, Result(id, Outcome::Failed, FailureKind::UnknownTweak,
                "Recorded tweak is not in this catalog, entry kept"));
            continue;
        }

        if (!tweak->reversible || !tweak->undo) {
            Report(report.results, observer, Result(id, Outcome::Failed, FailureKind::UnknownTweak,
                "Recorded tweak is not reversible in this catalog, entry kept"));
            continue;
        }

        if (tweak->requires_elevation && !privileges.IsElevated()) {
            Report(report.results, observer, Result(id, Outcome::SkippedInsufficientPrivilege));
            continue;
        }

        try {
            tweak->undo(executor, entry.prior_state);
        } catch (const std::exception& ex) {
            Report(report.results, observer, Result(id, Outcome::Failed, FailureKind::Execution, ex.what()));
            continue;
        }

        record.Remove(id);
        try {
            store.Save(record);
        } catch (const PersistenceException& ex) {
            Report(report.results, observer, Result(id, Outcome::Failed, FailureKind::Persistence,
                std::format("Restored but still recorded: {}", ex.message)));

            for (size_t j = i + 1; j < entries.size(); j++) {
                Report(report.results, observer, Result(entries[j].first, Outcome::Failed, FailureKind::Persistence, NOT_ATTEMPTED));
            }
            break;
        }

        Report(report.results, observer, Result(id, Outcome::Restored));
    }

    return report;
}

EngineStatus TweakEngine::Status() {
    // No batch lock: every save replaces the whole record, so a load never
    // sees half a batch step
    AppliedRecord record = store.Load();
    EngineStatus status;

    for (const auto& tweak : catalog.List()) {
        TweakStatus ts { .tweak = &tweak };
        if (auto entry = record.Find(tweak.id)) {
            ts.applied = true;
            ts.applied_at = entry->applied_at;
        }
        status.tweaks.push_back(ts);
    }

    for (const auto& [id, _] : record.Entries()) {
        if (catalog.Find(id) == nullptr) status.stale_ids.push_back(id);
    }
    status.extras = record.Extras();

    return status;
}
