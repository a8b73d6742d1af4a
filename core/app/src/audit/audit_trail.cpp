#include "whalecopy/audit/audit_trail.hpp"
#include "whalecopy/errors.hpp"
#include "whalecopy/persistence/json_codec.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

namespace whalecopy {

namespace {

constexpr const char* kTransitionKind = "order_transition";
constexpr const char* kUpdateKind = "position_update";

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: replay the existing journal, then open it for appending
// -----------------------------------------------------------------------------
AuditTrail::AuditTrail(const std::string& journal_path) {
  replay(journal_path);
  journal_.open(journal_path, std::ios::out | std::ios::app);
  if (!journal_.is_open()) {
    throw DataIntegrityError("cannot open audit journal: " + journal_path);
  }
  std::cout << "[AuditTrail] journal " << journal_path << " ("
            << transitions_.size() << " transitions, " << updates_.size()
            << " position updates replayed)\n";
}

void AuditTrail::replay(const std::string& journal_path) {
  std::ifstream in(journal_path);
  if (!in.is_open()) {
    return;
  }

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    try {
      const nlohmann::json j = nlohmann::json::parse(line);
      const std::string kind = j.at("kind").get<std::string>();
      if (kind == kTransitionKind) {
        auto t = j.at("record").get<domain::OrderTransition>();
        by_order_[t.order_id].push_back(transitions_.size());
        next_transition_id_ = std::max(next_transition_id_, t.id + 1);
        transitions_.push_back(std::move(t));
      } else if (kind == kUpdateKind) {
        auto u = j.at("record").get<domain::PositionUpdate>();
        by_position_[u.position_id].push_back(updates_.size());
        next_update_id_ = std::max(next_update_id_, u.id + 1);
        updates_.push_back(std::move(u));
      } else {
        std::cerr << "[AuditTrail] WARNING: unknown record kind '" << kind
                  << "' at line " << line_no << ". Skipping.\n";
      }
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[AuditTrail] WARNING: malformed journal line " << line_no
                << ": " << e.what() << ". Skipping.\n";
    } catch (const DataIntegrityError& e) {
      std::cerr << "[AuditTrail] WARNING: invalid journal record at line "
                << line_no << ": " << e.what() << ". Skipping.\n";
    }
  }
}

void AuditTrail::writeLine(const char* kind, const nlohmann::json& body) {
  if (!journal_.is_open()) {
    return;
  }
  nlohmann::json line{{"kind", kind}, {"record", body}};
  journal_ << line.dump() << '\n';
  journal_.flush();
  if (!journal_) {
    throw DataIntegrityError("audit journal write failed");
  }
}

// -----------------------------------------------------------------------------
// appendTransition / appendUpdate
// -----------------------------------------------------------------------------
// The journal write happens before the in-memory append so that a failed
// write leaves no record the caller could mistake for a durable one.
// -----------------------------------------------------------------------------
domain::OrderTransition AuditTrail::appendTransition(
    domain::OrderTransition transition) {
  std::lock_guard lock(mutex_);
  transition.id = next_transition_id_;
  writeLine(kTransitionKind, transition);
  ++next_transition_id_;
  by_order_[transition.order_id].push_back(transitions_.size());
  transitions_.push_back(transition);
  return transition;
}

domain::PositionUpdate AuditTrail::appendUpdate(domain::PositionUpdate update) {
  std::lock_guard lock(mutex_);
  update.id = next_update_id_;
  writeLine(kUpdateKind, update);
  ++next_update_id_;
  by_position_[update.position_id].push_back(updates_.size());
  updates_.push_back(update);
  return update;
}

std::vector<domain::OrderTransition> AuditTrail::transitionsFor(
    const domain::OrderId& order_id) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::OrderTransition> result;
  auto it = by_order_.find(order_id);
  if (it == by_order_.end()) {
    return result;
  }
  for (std::size_t index : it->second) {
    result.push_back(transitions_[index]);
  }
  return result;
}

std::vector<domain::PositionUpdate> AuditTrail::updatesFor(
    const domain::PositionId& position_id) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::PositionUpdate> result;
  auto it = by_position_.find(position_id);
  if (it == by_position_.end()) {
    return result;
  }
  for (std::size_t index : it->second) {
    result.push_back(updates_[index]);
  }
  return result;
}

std::optional<domain::OrderTransition> AuditTrail::lastTransition(
    const domain::OrderId& order_id) const {
  std::lock_guard lock(mutex_);
  auto it = by_order_.find(order_id);
  if (it == by_order_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return transitions_[it->second.back()];
}

std::size_t AuditTrail::transitionCount() const {
  std::lock_guard lock(mutex_);
  return transitions_.size();
}

std::size_t AuditTrail::updateCount() const {
  std::lock_guard lock(mutex_);
  return updates_.size();
}

// -----------------------------------------------------------------------------
// recoverOrders / recoverPositions
// -----------------------------------------------------------------------------
// A record without a usable snapshot is skipped with a warning; the entity
// then recovers from its previous record, which verifyConsistency() in the
// executor reports as a mismatch against the store.
// -----------------------------------------------------------------------------
std::vector<domain::Order> AuditTrail::recoverOrders() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> result;
  for (const auto& [order_id, indices] : by_order_) {
    for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
      const auto& t = transitions_[*it];
      if (!t.metadata.contains("order")) {
        continue;
      }
      try {
        result.push_back(t.metadata.at("order").get<domain::Order>());
        break;
      } catch (const nlohmann::json::exception& e) {
        std::cerr << "[AuditTrail] WARNING: unreadable order snapshot in "
                  << "transition " << t.id << ": " << e.what() << "\n";
      }
    }
  }
  return result;
}

std::vector<domain::Position> AuditTrail::recoverPositions() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Position> result;
  for (const auto& [position_id, indices] : by_position_) {
    for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
      const auto& u = updates_[*it];
      if (!u.metadata.contains("position")) {
        continue;
      }
      try {
        result.push_back(u.metadata.at("position").get<domain::Position>());
        break;
      } catch (const nlohmann::json::exception& e) {
        std::cerr << "[AuditTrail] WARNING: unreadable position snapshot in "
                  << "update " << u.id << ": " << e.what() << "\n";
      }
    }
  }
  return result;
}

}  // namespace whalecopy
