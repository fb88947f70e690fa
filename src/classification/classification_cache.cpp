// src/classification/classification_cache.cpp
#include "holdings_ngin/classification/classification_cache.hpp"
#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_set>
#include "holdings_ngin/classification/concurrency_limiter.hpp"
#include "holdings_ngin/classification/heuristic_classifier.hpp"
#include "holdings_ngin/classification/lfu_cache.hpp"
#include "holdings_ngin/core/logger.hpp"

namespace holdings_ngin {

namespace {

using SteadyClock = std::chrono::steady_clock;

struct LookupOutcome {
    bool ok{false};
    SecurityType type{SecurityType::UNKNOWN};
    ErrorCode code{ErrorCode::NONE};
    std::string message;
    std::string persist_error;  // set when the answer could not be written to the store
};

struct PendingLookup {
    std::string ticker;
    std::shared_future<LookupOutcome> future;
    SteadyClock::time_point deadline;
};

bool is_unavailable(ErrorCode code) {
    return code == ErrorCode::CONNECTION_ERROR || code == ErrorCode::DATABASE_ERROR;
}

}  // namespace

// Shared with worker threads so late results can still be committed
struct ClassificationCache::State {
    State(ClassificationCacheConfig cfg, std::shared_ptr<ClassificationStore> s,
          std::shared_ptr<AuthoritativeClassifier> a, RetryPolicy r, Clock c, Spawner sp)
        : config(std::move(cfg)),
          store(std::move(s)),
          authoritative(std::move(a)),
          retry(std::move(r)),
          clock(c ? std::move(c) : Clock([] { return std::chrono::system_clock::now(); })),
          spawn(sp ? std::move(sp) : Spawner([](std::function<void()> task) {
              std::thread(std::move(task)).detach();
          })),
          memory(config.memory_capacity),
          limiter(config.max_concurrent_lookups) {}

    ClassificationCacheConfig config;
    std::shared_ptr<ClassificationStore> store;
    std::shared_ptr<AuthoritativeClassifier> authoritative;
    RetryPolicy retry;
    Clock clock;
    Spawner spawn;
    HeuristicClassifier heuristic;

    mutable std::mutex memory_mutex;
    LfuCache<std::string, ClassificationCacheEntry> memory;

    ConcurrencyLimiter limiter;
    std::mutex inflight_mutex;
    std::unordered_map<std::string, std::shared_future<LookupOutcome>> inflight;

    std::mutex workers_mutex;
    std::condition_variable workers_cv;
    size_t active_workers{0};

    std::atomic<uint64_t> memory_hits{0};
    std::atomic<uint64_t> persistent_hits{0};
    std::atomic<uint64_t> authoritative_hits{0};
    std::atomic<uint64_t> heuristic_hits{0};
    std::atomic<uint64_t> authoritative_calls{0};
    std::atomic<uint64_t> authoritative_timeouts{0};
    std::atomic<uint64_t> authoritative_failures{0};
    std::atomic<uint64_t> store_errors{0};

    std::optional<ClassificationCacheEntry> fresh_memory_entry(const std::string& ticker) {
        std::lock_guard<std::mutex> lock(memory_mutex);
        auto entry = memory.get(ticker);
        if (!entry || entry->is_stale(clock())) {
            return std::nullopt;
        }
        return entry;
    }

    void put_memory(const ClassificationCacheEntry& entry) {
        std::lock_guard<std::mutex> lock(memory_mutex);
        memory.put(entry.ticker, entry);
    }

    /**
     * Heuristic answers never replace a fresh entry from a better tier, which a
     * late authoritative success may have written in the meantime.
     */
    std::optional<ClassificationCacheEntry> put_heuristic(const ClassificationCacheEntry& entry) {
        std::lock_guard<std::mutex> lock(memory_mutex);
        auto existing = memory.peek(entry.ticker);
        if (existing && existing->source_tier != ClassificationTier::HEURISTIC &&
            !existing->is_stale(clock())) {
            return existing;
        }
        memory.put(entry.ticker, entry);
        return std::nullopt;
    }

    Result<void> commit_authoritative(const std::string& ticker, SecurityType type,
                                      bool persist) {
        ClassificationCacheEntry entry;
        entry.ticker = ticker;
        entry.security_type = type;
        entry.source_tier = ClassificationTier::AUTHORITATIVE;
        entry.resolved_at = clock();
        entry.ttl = config.authoritative_ttl;

        put_memory(entry);
        if (persist && store) {
            auto stored = store->put(entry);
            if (stored.is_error()) {
                ++store_errors;
                WARN("Failed to persist classification for " << ticker << ": "
                                                             << stored.error()->what());
                return stored;
            }
        }
        return Result<void>();
    }

    LookupOutcome run_lookup(const std::string& ticker) {
        LookupOutcome outcome;
        try {
            auto result = retry.execute([&] { return authoritative->lookup(ticker); },
                                        "Authoritative lookup for " + ticker);
            if (result.is_ok()) {
                outcome.ok = true;
                outcome.type = result.value().to_security_type();
            } else {
                outcome.code = result.error()->code();
                outcome.message = result.error()->what();
            }
        } catch (const std::exception& e) {
            outcome.code = ErrorCode::API_ERROR;
            outcome.message = std::string("Authoritative classifier threw: ") + e.what();
        }
        return outcome;
    }

    /**
     * Undo a launch whose worker never started. Callers already joined on the
     * future see the failure instead of a broken promise.
     */
    void abandon_launch(const std::string& ticker, std::promise<LookupOutcome>& promise,
                        const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(inflight_mutex);
            inflight.erase(ticker);
        }
        limiter.release();
        worker_finished();

        LookupOutcome outcome;
        outcome.code = ErrorCode::API_ERROR;
        outcome.message = "Could not start authoritative lookup: " + reason;
        promise.set_value(std::move(outcome));
    }

    void worker_started() {
        std::lock_guard<std::mutex> lock(workers_mutex);
        ++active_workers;
    }

    void worker_finished() {
        {
            std::lock_guard<std::mutex> lock(workers_mutex);
            --active_workers;
        }
        workers_cv.notify_all();
    }
};

nlohmann::json CacheStats::to_json() const {
    nlohmann::json j;
    j["memory_hits"] = memory_hits;
    j["persistent_hits"] = persistent_hits;
    j["authoritative_hits"] = authoritative_hits;
    j["heuristic_hits"] = heuristic_hits;
    j["authoritative_calls"] = authoritative_calls;
    j["authoritative_timeouts"] = authoritative_timeouts;
    j["authoritative_failures"] = authoritative_failures;
    j["store_errors"] = store_errors;
    j["memory_size"] = memory_size;
    return j;
}

std::unordered_map<std::string, double> CacheStats::to_metrics() const {
    return {{"memory_hits", static_cast<double>(memory_hits)},
            {"persistent_hits", static_cast<double>(persistent_hits)},
            {"authoritative_hits", static_cast<double>(authoritative_hits)},
            {"heuristic_hits", static_cast<double>(heuristic_hits)},
            {"authoritative_timeouts", static_cast<double>(authoritative_timeouts)},
            {"authoritative_failures", static_cast<double>(authoritative_failures)},
            {"memory_size", static_cast<double>(memory_size)}};
}

std::vector<ConfigValidationError> ClassificationCacheConfig::validate() const {
    std::vector<ConfigValidationError> errors;
    if (memory_capacity == 0) {
        errors.push_back({"classification.memory_capacity", "Must be greater than 0"});
    }
    if (max_concurrent_lookups == 0) {
        errors.push_back({"classification.max_concurrent_lookups", "Must be greater than 0"});
    }
    if (authoritative_ttl.count() <= 0 || heuristic_ttl.count() <= 0) {
        errors.push_back({"classification.ttl", "TTLs must be positive"});
    }
    if (lookup_timeout.count() <= 0) {
        errors.push_back({"classification.lookup_timeout_ms", "Must be positive"});
    }
    if (batch_timeout.count() <= 0) {
        errors.push_back({"classification.batch_timeout_ms", "Must be positive"});
    }
    return errors;
}

nlohmann::json ClassificationCacheConfig::to_json() const {
    nlohmann::json j;
    j["memory_capacity"] = memory_capacity;
    j["authoritative_ttl_seconds"] = authoritative_ttl.count();
    j["heuristic_ttl_seconds"] = heuristic_ttl.count();
    j["max_concurrent_lookups"] = max_concurrent_lookups;
    j["lookup_timeout_ms"] = lookup_timeout.count();
    j["batch_timeout_ms"] = batch_timeout.count();
    j["shutdown_grace_ms"] = shutdown_grace.count();
    return j;
}

void ClassificationCacheConfig::from_json(const nlohmann::json& j) {
    if (j.contains("memory_capacity"))
        memory_capacity = j.at("memory_capacity").get<size_t>();
    if (j.contains("authoritative_ttl_seconds"))
        authoritative_ttl = std::chrono::seconds(j.at("authoritative_ttl_seconds").get<int64_t>());
    if (j.contains("heuristic_ttl_seconds"))
        heuristic_ttl = std::chrono::seconds(j.at("heuristic_ttl_seconds").get<int64_t>());
    if (j.contains("max_concurrent_lookups"))
        max_concurrent_lookups = j.at("max_concurrent_lookups").get<size_t>();
    if (j.contains("lookup_timeout_ms"))
        lookup_timeout = std::chrono::milliseconds(j.at("lookup_timeout_ms").get<int64_t>());
    if (j.contains("batch_timeout_ms"))
        batch_timeout = std::chrono::milliseconds(j.at("batch_timeout_ms").get<int64_t>());
    if (j.contains("shutdown_grace_ms"))
        shutdown_grace = std::chrono::milliseconds(j.at("shutdown_grace_ms").get<int64_t>());
}

ClassificationCache::ClassificationCache(ClassificationCacheConfig config,
                                         std::shared_ptr<ClassificationStore> store,
                                         std::shared_ptr<AuthoritativeClassifier> authoritative,
                                         RetryPolicy retry, Clock clock, Spawner spawner)
    : state_(std::make_shared<State>(std::move(config), std::move(store),
                                     std::move(authoritative), std::move(retry),
                                     std::move(clock), std::move(spawner))) {
    Logger::register_component("ClassificationCache");
}

ClassificationCache::~ClassificationCache() {
    std::unique_lock<std::mutex> lock(state_->workers_mutex);
    if (!state_->workers_cv.wait_for(lock, state_->config.shutdown_grace,
                                     [this] { return state_->active_workers == 0; })) {
        WARN("Destroying classification cache with " << state_->active_workers
                                                     << " authoritative lookups still running");
    }
}

ResolutionResult ClassificationCache::resolve(const std::vector<std::string>& tickers) {
    return resolve_impl(tickers, Hints(), false);
}

ResolutionResult ClassificationCache::resolve(const std::vector<std::string>& tickers,
                                              const Hints& hints) {
    return resolve_impl(tickers, hints, false);
}

ResolutionResult ClassificationCache::force_refresh(const std::vector<std::string>& tickers) {
    for (const auto& ticker : tickers) {
        invalidate(ticker);
    }
    return resolve_impl(tickers, Hints(), true);
}

Result<ResolutionResult> ClassificationCache::refresh_stale(std::chrono::seconds max_age) {
    if (!state_->store) {
        return make_error<ResolutionResult>(ErrorCode::NOT_INITIALIZED,
                                            "No persistent store configured",
                                            "ClassificationCache");
    }

    auto stale = state_->store->list_stale(max_age, state_->clock());
    if (stale.is_error()) {
        return make_error<ResolutionResult>(stale.error()->code(), stale.error()->what(),
                                            "ClassificationCache");
    }

    INFO("Refreshing " << stale.value().size() << " classifications older than "
                       << max_age.count() << "s");
    return force_refresh(stale.value());
}

bool ClassificationCache::invalidate(const std::string& ticker) {
    std::lock_guard<std::mutex> lock(state_->memory_mutex);
    return state_->memory.erase(normalize_ticker(ticker));
}

CacheStats ClassificationCache::stats() const {
    CacheStats stats;
    stats.memory_hits = state_->memory_hits.load();
    stats.persistent_hits = state_->persistent_hits.load();
    stats.authoritative_hits = state_->authoritative_hits.load();
    stats.heuristic_hits = state_->heuristic_hits.load();
    stats.authoritative_calls = state_->authoritative_calls.load();
    stats.authoritative_timeouts = state_->authoritative_timeouts.load();
    stats.authoritative_failures = state_->authoritative_failures.load();
    stats.store_errors = state_->store_errors.load();
    {
        std::lock_guard<std::mutex> lock(state_->memory_mutex);
        stats.memory_size = state_->memory.size();
    }
    return stats;
}

std::optional<ClassificationCacheEntry> ClassificationCache::memory_entry(
    const std::string& ticker) const {
    std::lock_guard<std::mutex> lock(state_->memory_mutex);
    return state_->memory.peek(normalize_ticker(ticker));
}

const ClassificationCacheConfig& ClassificationCache::config() const {
    return state_->config;
}

ResolutionResult ClassificationCache::resolve_impl(const std::vector<std::string>& tickers,
                                                   const Hints& hints, bool bypass_caches) {
    auto& state = *state_;
    ResolutionResult result;

    std::vector<std::string> pending;
    std::unordered_set<std::string> seen;
    for (const auto& raw : tickers) {
        auto ticker = normalize_ticker(raw);
        if (!ticker.empty() && seen.insert(ticker).second) {
            pending.push_back(ticker);
        }
    }

    auto hint_for = [&hints](const std::string& ticker) -> std::string {
        auto it = hints.find(ticker);
        return it == hints.end() ? std::string() : it->second;
    };

    auto warn = [&result](WarningCode code, const std::string& ticker, const std::string& msg) {
        WARN(warning_code_to_string(code) << ": " << msg);
        result.warnings.push_back(Warning{code, msg, ticker, ""});
    };

    // Tier 1: memory
    if (!bypass_caches) {
        std::vector<std::string> misses;
        for (const auto& ticker : pending) {
            if (auto entry = state.fresh_memory_entry(ticker)) {
                ++state.memory_hits;
                result.classifications[ticker] =
                    Classification{entry->security_type, ClassificationTier::MEMORY,
                                   entry->source_tier};
            } else {
                misses.push_back(ticker);
            }
        }
        pending.swap(misses);
    }

    // Tier 2: persistent
    bool store_available = state.store != nullptr;
    if (!bypass_caches && store_available && !pending.empty()) {
        std::vector<std::string> misses;
        const auto now = state.clock();
        for (const auto& ticker : pending) {
            if (!store_available) {
                misses.push_back(ticker);
                continue;
            }

            auto stored = state.store->get(ticker);
            if (stored.is_error()) {
                ++state.store_errors;
                if (is_unavailable(stored.error()->code())) {
                    store_available = false;
                    warn(WarningCode::PERSISTENT_STORE_UNAVAILABLE, "",
                         "Persistent classification store unavailable, skipping tier: " +
                             std::string(stored.error()->what()));
                } else {
                    warn(WarningCode::PERSISTENT_STORE_ERROR, ticker,
                         "Persistent lookup of " + ticker +
                             " failed: " + std::string(stored.error()->what()));
                }
                misses.push_back(ticker);
                continue;
            }

            const auto& entry = stored.value();
            if (entry && !entry->is_stale(now)) {
                ++state.persistent_hits;
                state.put_memory(*entry);
                result.classifications[ticker] = Classification{
                    entry->security_type, ClassificationTier::PERSISTENT, entry->source_tier};
            } else {
                misses.push_back(ticker);
            }
        }
        pending.swap(misses);
    }

    // Tier 3: authoritative
    if (state.authoritative && !pending.empty()) {
        const auto batch_deadline = SteadyClock::now() + state.config.batch_timeout;
        std::vector<PendingLookup> lookups;
        std::vector<std::string> unresolved;

        // Workers commit to memory before leaving inflight, so memory is checked again
        // under inflight_mutex before a new call is launched.
        auto reuse_committed = [&](const std::string& ticker) {
            if (bypass_caches)
                return false;
            auto entry = state.fresh_memory_entry(ticker);
            if (!entry || entry->source_tier == ClassificationTier::HEURISTIC)
                return false;
            ++state.memory_hits;
            result.classifications[ticker] =
                Classification{entry->security_type, ClassificationTier::MEMORY,
                               entry->source_tier};
            return true;
        };

        for (const auto& ticker : pending) {
            std::shared_future<LookupOutcome> future;
            bool joined = false;
            bool reused = false;
            {
                std::lock_guard<std::mutex> lock(state.inflight_mutex);
                auto it = state.inflight.find(ticker);
                if (it != state.inflight.end()) {
                    future = it->second;
                    joined = true;
                } else {
                    reused = reuse_committed(ticker);
                }
            }
            if (reused)
                continue;

            if (!joined) {
                if (!state.limiter.acquire_until(batch_deadline)) {
                    ++state.authoritative_timeouts;
                    warn(WarningCode::AUTHORITATIVE_LOOKUP_TIMEOUT, ticker,
                         "Batch deadline reached before authoritative lookup of " + ticker +
                             " could start");
                    unresolved.push_back(ticker);
                    continue;
                }

                auto promise = std::make_shared<std::promise<LookupOutcome>>();
                {
                    std::lock_guard<std::mutex> lock(state.inflight_mutex);
                    auto it = state.inflight.find(ticker);
                    if (it != state.inflight.end()) {
                        // another caller launched it while we waited for a permit
                        future = it->second;
                        joined = true;
                    } else if (reuse_committed(ticker)) {
                        reused = true;
                    } else {
                        future = promise->get_future().share();
                        state.inflight.emplace(ticker, future);
                    }
                }

                if (joined || reused) {
                    state.limiter.release();
                    if (reused)
                        continue;
                } else {
                    state.worker_started();
                    const bool persist = store_available;
                    try {
                        state.spawn([shared = state_, ticker, persist, promise]() {
                            Logger::register_component("ClassificationCache");
                            auto outcome = shared->run_lookup(ticker);
                            if (outcome.ok) {
                                auto committed =
                                    shared->commit_authoritative(ticker, outcome.type, persist);
                                if (committed.is_error())
                                    outcome.persist_error = committed.error()->what();
                            }
                            {
                                std::lock_guard<std::mutex> lock(shared->inflight_mutex);
                                shared->inflight.erase(ticker);
                            }
                            shared->limiter.release();
                            promise->set_value(std::move(outcome));
                            shared->worker_finished();
                        });
                        ++state.authoritative_calls;
                    } catch (const std::exception& e) {
                        ERROR("Failed to start authoritative lookup of " << ticker << ": "
                                                                         << e.what());
                        state.abandon_launch(ticker, *promise, e.what());
                    }
                }
            }

            auto call_deadline = SteadyClock::now() + state.config.lookup_timeout;
            lookups.push_back(PendingLookup{ticker, future, std::min(call_deadline, batch_deadline)});
        }

        for (const auto& lookup : lookups) {
            if (lookup.future.wait_until(lookup.deadline) != std::future_status::ready) {
                ++state.authoritative_timeouts;
                warn(WarningCode::AUTHORITATIVE_LOOKUP_TIMEOUT, lookup.ticker,
                     "Authoritative lookup of " + lookup.ticker + " timed out");
                unresolved.push_back(lookup.ticker);
                continue;
            }

            const auto& outcome = lookup.future.get();
            if (outcome.ok) {
                ++state.authoritative_hits;
                result.classifications[lookup.ticker] = Classification{
                    outcome.type, ClassificationTier::AUTHORITATIVE,
                    ClassificationTier::AUTHORITATIVE};
                if (!outcome.persist_error.empty()) {
                    warn(WarningCode::PERSISTENT_STORE_ERROR, lookup.ticker,
                         "Classification of " + lookup.ticker +
                             " was not persisted: " + outcome.persist_error);
                }
            } else {
                ++state.authoritative_failures;
                warn(WarningCode::AUTHORITATIVE_LOOKUP_FAILURE, lookup.ticker,
                     "Authoritative lookup of " + lookup.ticker + " failed (" +
                         error_code_to_string(outcome.code) + "): " + outcome.message);
                unresolved.push_back(lookup.ticker);
            }
        }
        pending.swap(unresolved);
    }

    // Tier 4: heuristic
    for (const auto& ticker : pending) {
        ClassificationCacheEntry entry;
        entry.ticker = ticker;
        entry.security_type = state.heuristic.classify(ticker, hint_for(ticker));
        entry.source_tier = ClassificationTier::HEURISTIC;
        entry.resolved_at = state.clock();
        entry.ttl = state.config.heuristic_ttl;

        if (auto better = state.put_heuristic(entry)) {
            // a late authoritative answer arrived while this batch was timing out
            ++state.memory_hits;
            result.classifications[ticker] =
                Classification{better->security_type, ClassificationTier::MEMORY,
                               better->source_tier};
            continue;
        }

        ++state.heuristic_hits;
        result.classifications[ticker] = Classification{
            entry.security_type, ClassificationTier::HEURISTIC, ClassificationTier::HEURISTIC};
        DEBUG("Heuristic classification " << ticker << " -> "
                                          << security_type_to_string(entry.security_type));
    }

    return result;
}

}  // namespace holdings_ngin
