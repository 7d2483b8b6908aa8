// modules/session/session_store.cpp
#include "modules/session/session_store.h"
#include "modules/context/context_engine.h"
#include "common/log/logger.h"
#include <fstream>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace swarmflow {

namespace {

RiskTier tier_from_string(const std::string& s) {
    if (s == "T0") return RiskTier::T0;
    if (s == "T1") return RiskTier::T1;
    if (s == "T2") return RiskTier::T2;
    if (s == "T3") return RiskTier::T3;
    throw std::runtime_error("Invalid risk tier in checkpoint: " + s);
}

WorkflowStatus status_from_string(const std::string& s) {
    for (auto st : {WorkflowStatus::NOT_STARTED, WorkflowStatus::RUNNING, WorkflowStatus::AWAITING_CONFIRMATION,
                    WorkflowStatus::AWAITING_ACKNOWLEDGMENT, WorkflowStatus::ALL_PHASES_COMPLETED,
                    WorkflowStatus::ABORTED_FAILED}) {
        if (s == to_string(st)) return st;
    }
    throw std::runtime_error("Invalid workflow status in checkpoint: " + s);
}

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

nlohmann::json transition_to_json(const Transition& t) {
    return {{"from", t.from}, {"to", t.to}, {"phase", t.phase_index}, {"at_ms", to_epoch_ms(t.at)},
            {"note", t.note}};
}

Transition transition_from_json(const nlohmann::json& j) {
    Transition t;
    t.from = j.value("from", "");
    t.to = j.value("to", "");
    t.phase_index = j.value("phase", -1);
    t.at = std::chrono::system_clock::time_point(std::chrono::milliseconds(j.value("at_ms", int64_t{0})));
    t.note = j.value("note", "");
    return t;
}

nlohmann::json record_to_json(const SessionRecord& r) {
    nlohmann::json history = nlohmann::json::array();
    for (const auto& t : r.history) history.push_back(transition_to_json(t));
    return {{"request_id", r.request_id},
            {"instance_id", r.instance_id},
            {"workflow", r.workflow_label},
            {"task_type", r.task_type},
            {"score", {{"dimensions", r.score.dimensions},
                       {"aggregate", r.score.aggregate},
                       {"estimated_tokens", r.score.estimated_tokens}}},
            {"status", to_string(r.status)},
            {"history", std::move(history)}};
}

SessionRecord record_from_json(const nlohmann::json& j) {
    SessionRecord r;
    r.request_id = j.at("request_id").get<std::string>();
    r.instance_id = j.value("instance_id", "");
    r.workflow_label = j.value("workflow", "");
    r.task_type = j.value("task_type", "");
    if (j.contains("score")) {
        const auto& s = j["score"];
        r.score.dimensions = s.value("dimensions", std::map<std::string, double>{});
        r.score.aggregate = s.value("aggregate", 0.0);
        r.score.estimated_tokens = s.value("estimated_tokens", 0L);
    }
    r.status = status_from_string(j.value("status", std::string(to_string(WorkflowStatus::NOT_STARTED))));
    for (const auto& t : j.value("history", nlohmann::json::array())) {
        r.history.push_back(transition_from_json(t));
    }
    return r;
}

} // namespace

// ---------------- RiskLedger ----------------

RiskTier RiskLedger::record(const std::string& task_id, RiskTier tier) {
    auto it = tiers_.find(task_id);
    if (it == tiers_.end()) {
        tiers_.emplace(task_id, tier);
        return tier;
    }
    if (tier < it->second) {
        log::logger()->debug("risk ledger: keeping {} for '{}' (reclassified as {})", to_string(it->second),
                             task_id, to_string(tier));
    }
    it->second = max_tier(it->second, tier);
    return it->second;
}

RiskTier RiskLedger::escalate(const std::string& task_id, RiskTier tier, const std::string& reason) {
    auto it = tiers_.find(task_id);
    RiskTier from = (it == tiers_.end()) ? RiskTier::T0 : it->second;
    if (it != tiers_.end() && tier <= from) return from;

    tiers_[task_id] = tier;
    escalations_.push_back({task_id, from, tier, reason});
    log::logger()->info("risk escalated for '{}': {} -> {} ({})", task_id, to_string(from), to_string(tier), reason);
    return tier;
}

std::optional<RiskTier> RiskLedger::tier_of(const std::string& task_id) const {
    auto it = tiers_.find(task_id);
    if (it == tiers_.end()) return std::nullopt;
    return it->second;
}

nlohmann::json RiskLedger::to_json() const {
    nlohmann::json tiers = nlohmann::json::object();
    for (const auto& [task, tier] : tiers_) tiers[task] = to_string(tier);
    nlohmann::json escalations = nlohmann::json::array();
    for (const auto& e : escalations_) {
        escalations.push_back({{"task", e.task_id}, {"from", to_string(e.from)}, {"to", to_string(e.to)},
                               {"reason", e.reason}});
    }
    return {{"tiers", std::move(tiers)}, {"escalations", std::move(escalations)}};
}

void RiskLedger::load_json(const nlohmann::json& j) {
    tiers_.clear();
    escalations_.clear();
    for (const auto& [task, tier] : j.value("tiers", nlohmann::json::object()).items()) {
        tiers_[task] = tier_from_string(tier.get<std::string>());
    }
    for (const auto& e : j.value("escalations", nlohmann::json::array())) {
        escalations_.push_back({e.value("task", ""), tier_from_string(e.value("from", "T0")),
                                tier_from_string(e.value("to", "T0")), e.value("reason", "")});
    }
}

// ---------------- SessionStore ----------------

void SessionStore::create(const std::string& request_id, const std::string& instance_id, const Score& score,
                          const std::string& workflow_label, const std::string& task_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.count(request_id)) {
        throw std::invalid_argument("Duplicate request id in session: " + request_id);
    }
    SessionRecord r;
    r.request_id = request_id;
    r.instance_id = instance_id;
    r.score = score;
    r.workflow_label = workflow_label;
    r.task_type = task_type;
    records_.emplace(request_id, std::move(r));
}

void SessionStore::append_transitions(const std::string& request_id, const std::vector<Transition>& transitions) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(request_id);
    if (it == records_.end()) {
        throw std::out_of_range("Unknown request id: " + request_id);
    }
    it->second.history.insert(it->second.history.end(), transitions.begin(), transitions.end());
}

void SessionStore::set_status(const std::string& request_id, WorkflowStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(request_id);
    if (it == records_.end()) {
        throw std::out_of_range("Unknown request id: " + request_id);
    }
    it->second.status = status;
}

std::optional<SessionRecord> SessionStore::record(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(request_id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> SessionStore::request_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(records_.size());
    for (const auto& [id, _] : records_) ids.push_back(id);
    return ids;
}

RiskTier SessionStore::record_tier(const std::string& task_id, RiskTier tier) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.record(task_id, tier);
}

RiskTier SessionStore::escalate_tier(const std::string& task_id, RiskTier tier, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.escalate(task_id, tier, reason);
}

std::optional<RiskTier> SessionStore::tier_of(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.tier_of(task_id);
}

void SessionStore::record_outcome(const std::string& task_type, const std::string& workflow_label, bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stats = outcomes_[task_type][workflow_label];
    ++stats.total;
    if (success) ++stats.success;
}

std::optional<std::string> SessionStore::outcome_hint(const std::string& task_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = outcomes_.find(task_type);
    if (it == outcomes_.end()) return std::nullopt;

    // 至少 2 个样本且成功率 > 60%，取成功率最高的 workflow
    std::string best_label;
    double best_rate = 0.0;
    for (const auto& [label, stats] : it->second) {
        if (stats.total < 2) continue;
        double rate = static_cast<double>(stats.success) / stats.total;
        if (rate > 0.6 && rate > best_rate) {
            best_rate = rate;
            best_label = label;
        }
    }
    if (best_label.empty()) return std::nullopt;
    return fmt::format("Similar {} tasks succeeded {:.0f}% with {}", task_type, best_rate * 100.0, best_label);
}

SessionState SessionStore::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

uint64_t SessionStore::apply_patches(const std::vector<Context>& patches) {
    std::lock_guard<std::mutex> lock(mutex_);
    ContextEngine::apply_patches(state_, patches, ContextMergePolicy::last_write_wins());
    return state_.version;
}

nlohmann::json SessionStore::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json records = nlohmann::json::array();
    for (const auto& [_, r] : records_) records.push_back(record_to_json(r));

    nlohmann::json outcomes = nlohmann::json::object();
    for (const auto& [type, by_label] : outcomes_) {
        for (const auto& [label, stats] : by_label) {
            outcomes[type][label] = {{"total", stats.total}, {"success", stats.success}};
        }
    }
    return {{"records", std::move(records)},
            {"risk", ledger_.to_json()},
            {"outcomes", std::move(outcomes)},
            {"state", {{"data", state_.data}, {"version", state_.version}}}};
}

void SessionStore::load_json(const nlohmann::json& j) {
    std::map<std::string, SessionRecord> records;
    for (const auto& r : j.value("records", nlohmann::json::array())) {
        auto rec = record_from_json(r);
        records[rec.request_id] = std::move(rec);
    }
    RiskLedger ledger;
    ledger.load_json(j.value("risk", nlohmann::json::object()));

    std::map<std::string, std::map<std::string, OutcomeStats>> outcomes;
    for (const auto& [type, by_label] : j.value("outcomes", nlohmann::json::object()).items()) {
        for (const auto& [label, stats] : by_label.items()) {
            outcomes[type][label] = {stats.value("total", 0), stats.value("success", 0)};
        }
    }

    SessionState state;
    if (j.contains("state")) {
        state.data = j["state"].value("data", Context::object());
        state.version = j["state"].value("version", uint64_t{0});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    records_ = std::move(records);
    ledger_ = std::move(ledger);
    outcomes_ = std::move(outcomes);
    state_ = std::move(state);
}

void SessionStore::checkpoint(const std::string& path) const {
    auto snapshot = to_json();
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open session checkpoint for writing: " + path);
    }
    out << snapshot.dump(2);
    log::logger()->info("session checkpoint written to {}", path);
}

void SessionStore::restore(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open session checkpoint: " + path);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Corrupt session checkpoint " + path + ": " + e.what());
    }
    load_json(j);
    log::logger()->info("session restored from {} ({} records)", path, request_ids().size());
}

} // namespace swarmflow
