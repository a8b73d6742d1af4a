#pragma once

#include "whalecopy/execution/exchange_error.hpp"
#include "whalecopy/execution/i_exchange_client.hpp"
#include "whalecopy/time/i_time_provider.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace whalecopy {

// -----------------------------------------------------------------------------
// SimulatedExchangeClient - deterministic in-process exchange
// -----------------------------------------------------------------------------
//
// @brief  IExchangeClient used by the paper-trading executable and by every
//         test that drives OrderExecutor or CopyTradingEngine.
//
// @details
// Fill model:
//   - An accepted order fills immediately up to size * fill_ratio, walking
//     the opposite side of the token's book and only taking levels at or
//     better than the limit price. Without a book the order fills at its
//     limit price. The book itself is not depleted.
//   - fill_ratio comes from the scripted queue (one entry per accepted
//     order) or the default ratio (1.0).
//   - advanceFill() raises an order's cumulative fill later, as a push
//     feed would report it.
//
// Idempotency: client_order_id is remembered. Submitting a known id again
// returns the original exchange order id with duplicate == true, even when
// the original acknowledgement was "lost".
//
// Fault scripting: failNext*() queues errors returned by the next calls of
// each operation. loseNextAcks() accepts the order and then throws Timeout,
// which reproduces the network failure a duplicate-safe retry must survive.
//
// Thread model: one internal mutex; every method is thread-safe.
// -----------------------------------------------------------------------------
class SimulatedExchangeClient final : public IExchangeClient {
 public:
  explicit SimulatedExchangeClient(const ITimeProvider& clock);

  SimulatedExchangeClient(const SimulatedExchangeClient&) = delete;
  SimulatedExchangeClient& operator=(const SimulatedExchangeClient&) = delete;

  SubmitAck submitOrder(const SubmitRequest& request) override;
  void cancelOrder(const std::string& exchange_order_id) override;
  domain::OrderBook fetchOrderBook(const std::string& token_id) override;
  FillStatus pollFill(const std::string& exchange_order_id) override;

  // --- Market setup ---------------------------------------------------------
  void setOrderBook(domain::OrderBook book);
  void closeMarket(const std::string& token_id);

  // --- Fill scripting -------------------------------------------------------
  void setDefaultFillRatio(double ratio);
  void scriptFillRatios(const std::vector<double>& ratios);

  // Raises the cumulative fill of an order and returns the report a push
  // feed would deliver for it.
  FillReport advanceFill(const std::string& exchange_order_id,
                         double cumulative_size, double avg_price);

  // --- Fault scripting ------------------------------------------------------
  void failNextSubmits(ExchangeErrorCode code, int count = 1);
  void loseNextAcks(int count = 1);
  void failNextPolls(ExchangeErrorCode code, int count = 1);
  void failNextCancels(ExchangeErrorCode code, int count = 1);
  void failNextBookFetches(ExchangeErrorCode code, int count = 1);

  // --- Inspection -----------------------------------------------------------
  int submissionCount() const;   // Distinct orders placed
  int submitAttempts() const;    // Every submitOrder() call
  int cancelCount() const;
  std::optional<FillStatus> orderStatus(const std::string& exchange_order_id) const;
  std::optional<std::string> exchangeIdFor(const std::string& client_order_id) const;

 private:
  struct SimOrder {
    SubmitRequest request;
    FillStatus status;
  };

  static void throwScripted(std::deque<ExchangeErrorCode>& queue,
                            const char* operation);
  void fillLocked(SimOrder& order, double ratio);

  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::map<std::string, domain::OrderBook> books_;
  std::set<std::string> closed_markets_;
  std::map<std::string, SimOrder> orders_;              // By exchange id
  std::map<std::string, std::string> by_client_id_;
  std::uint64_t next_exchange_id_{1};

  double default_fill_ratio_{1.0};
  std::deque<double> scripted_ratios_;

  std::deque<ExchangeErrorCode> submit_faults_;
  int lost_acks_{0};
  std::deque<ExchangeErrorCode> poll_faults_;
  std::deque<ExchangeErrorCode> cancel_faults_;
  std::deque<ExchangeErrorCode> book_faults_;

  int submissions_{0};
  int submit_attempts_{0};
  int cancels_{0};
};

}  // namespace whalecopy
