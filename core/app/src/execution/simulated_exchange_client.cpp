#include "whalecopy/execution/simulated_exchange_client.hpp"

#include <algorithm>
#include <utility>

namespace whalecopy {

SimulatedExchangeClient::SimulatedExchangeClient(const ITimeProvider& clock)
    : clock_(clock) {}

void SimulatedExchangeClient::throwScripted(std::deque<ExchangeErrorCode>& queue,
                                            const char* operation) {
  if (queue.empty()) {
    return;
  }
  const ExchangeErrorCode code = queue.front();
  queue.pop_front();
  throw ExchangeError(code, std::string("simulated ") + operation + " failure");
}

// -----------------------------------------------------------------------------
// submitOrder: dedupe by client id, validate, place and fill
// -----------------------------------------------------------------------------
SubmitAck SimulatedExchangeClient::submitOrder(const SubmitRequest& request) {
  std::lock_guard lock(mutex_);
  ++submit_attempts_;

  if (request.deadline_ms > 0 && clock_.now_ms() > request.deadline_ms) {
    throw ExchangeError(ExchangeErrorCode::Timeout, "submit deadline passed");
  }
  throwScripted(submit_faults_, "submit");

  auto known = by_client_id_.find(request.client_order_id);
  if (known != by_client_id_.end()) {
    return SubmitAck{known->second, true};
  }

  if (closed_markets_.count(request.token_id) > 0) {
    throw ExchangeError(ExchangeErrorCode::MarketClosed, request.token_id);
  }
  if (request.price && (*request.price <= 0.0 || *request.price >= 1.0)) {
    throw ExchangeError(ExchangeErrorCode::InvalidPrice,
                        "price outside (0, 1)");
  }
  if (!(request.size > 0.0)) {
    throw ExchangeError(ExchangeErrorCode::Rejected, "size must be positive");
  }

  const std::string exchange_id = "ex-" + std::to_string(next_exchange_id_++);
  SimOrder order;
  order.request = request;
  order.status.exchange_order_id = exchange_id;

  double ratio = default_fill_ratio_;
  if (!scripted_ratios_.empty()) {
    ratio = scripted_ratios_.front();
    scripted_ratios_.pop_front();
  }
  fillLocked(order, ratio);

  orders_[exchange_id] = order;
  by_client_id_[request.client_order_id] = exchange_id;
  ++submissions_;

  if (lost_acks_ > 0) {
    --lost_acks_;
    throw ExchangeError(ExchangeErrorCode::Timeout,
                        "acknowledgement lost after placement");
  }
  return SubmitAck{exchange_id, false};
}

// -----------------------------------------------------------------------------
// fillLocked: walk the opposite side within the limit price
// -----------------------------------------------------------------------------
void SimulatedExchangeClient::fillLocked(SimOrder& order, double ratio) {
  const SubmitRequest& req = order.request;
  const double target = req.size * std::clamp(ratio, 0.0, 1.0);
  if (target <= 0.0) {
    return;
  }

  double filled = 0.0;
  double cost = 0.0;
  auto book = books_.find(req.token_id);
  if (book != books_.end()) {
    const bool buy = req.side == domain::Side::Buy;
    const auto& levels = buy ? book->second.asks : book->second.bids;
    for (const auto& level : levels) {
      if (filled >= target) {
        break;
      }
      if (req.price && (buy ? level.price > *req.price : level.price < *req.price)) {
        break;
      }
      const double take = std::min(target - filled, level.size);
      filled += take;
      cost += take * level.price;
    }
  } else if (req.price) {
    filled = target;
    cost = target * *req.price;
  }

  if (filled <= 0.0) {
    return;
  }
  order.status.filled_size = filled;
  order.status.avg_price = cost / filled;
  order.status.fill_sequence = 1;
  order.status.open = filled < req.size;
}

void SimulatedExchangeClient::cancelOrder(const std::string& exchange_order_id) {
  std::lock_guard lock(mutex_);
  throwScripted(cancel_faults_, "cancel");
  auto it = orders_.find(exchange_order_id);
  if (it == orders_.end()) {
    throw ExchangeError(ExchangeErrorCode::OrderNotFound, exchange_order_id);
  }
  it->second.status.open = false;
  ++cancels_;
}

domain::OrderBook SimulatedExchangeClient::fetchOrderBook(
    const std::string& token_id) {
  std::lock_guard lock(mutex_);
  throwScripted(book_faults_, "order book fetch");
  auto it = books_.find(token_id);
  if (it == books_.end()) {
    throw ExchangeError(ExchangeErrorCode::InvalidMarket, token_id);
  }
  return it->second;
}

FillStatus SimulatedExchangeClient::pollFill(const std::string& exchange_order_id) {
  std::lock_guard lock(mutex_);
  throwScripted(poll_faults_, "poll");
  auto it = orders_.find(exchange_order_id);
  if (it == orders_.end()) {
    throw ExchangeError(ExchangeErrorCode::OrderNotFound, exchange_order_id);
  }
  return it->second.status;
}

void SimulatedExchangeClient::setOrderBook(domain::OrderBook book) {
  std::lock_guard lock(mutex_);
  const std::string token = book.token_id;
  books_[token] = std::move(book);
}

void SimulatedExchangeClient::closeMarket(const std::string& token_id) {
  std::lock_guard lock(mutex_);
  closed_markets_.insert(token_id);
}

void SimulatedExchangeClient::setDefaultFillRatio(double ratio) {
  std::lock_guard lock(mutex_);
  default_fill_ratio_ = ratio;
}

void SimulatedExchangeClient::scriptFillRatios(const std::vector<double>& ratios) {
  std::lock_guard lock(mutex_);
  scripted_ratios_.insert(scripted_ratios_.end(), ratios.begin(), ratios.end());
}

FillReport SimulatedExchangeClient::advanceFill(const std::string& exchange_order_id,
                                                double cumulative_size,
                                                double avg_price) {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(exchange_order_id);
  if (it == orders_.end()) {
    throw ExchangeError(ExchangeErrorCode::OrderNotFound, exchange_order_id);
  }
  FillStatus& status = it->second.status;
  status.filled_size = std::min(cumulative_size, it->second.request.size);
  status.avg_price = avg_price;
  ++status.fill_sequence;
  status.open = status.open && status.filled_size < it->second.request.size;

  FillReport report;
  report.exchange_order_id = exchange_order_id;
  report.filled_size = status.filled_size;
  report.avg_price = status.avg_price;
  report.fill_sequence = status.fill_sequence;
  report.timestamp_ms = clock_.now_ms();
  return report;
}

void SimulatedExchangeClient::failNextSubmits(ExchangeErrorCode code, int count) {
  std::lock_guard lock(mutex_);
  submit_faults_.insert(submit_faults_.end(), static_cast<std::size_t>(count), code);
}

void SimulatedExchangeClient::loseNextAcks(int count) {
  std::lock_guard lock(mutex_);
  lost_acks_ += count;
}

void SimulatedExchangeClient::failNextPolls(ExchangeErrorCode code, int count) {
  std::lock_guard lock(mutex_);
  poll_faults_.insert(poll_faults_.end(), static_cast<std::size_t>(count), code);
}

void SimulatedExchangeClient::failNextCancels(ExchangeErrorCode code, int count) {
  std::lock_guard lock(mutex_);
  cancel_faults_.insert(cancel_faults_.end(), static_cast<std::size_t>(count), code);
}

void SimulatedExchangeClient::failNextBookFetches(ExchangeErrorCode code,
                                                  int count) {
  std::lock_guard lock(mutex_);
  book_faults_.insert(book_faults_.end(), static_cast<std::size_t>(count), code);
}

int SimulatedExchangeClient::submissionCount() const {
  std::lock_guard lock(mutex_);
  return submissions_;
}

int SimulatedExchangeClient::submitAttempts() const {
  std::lock_guard lock(mutex_);
  return submit_attempts_;
}

int SimulatedExchangeClient::cancelCount() const {
  std::lock_guard lock(mutex_);
  return cancels_;
}

std::optional<FillStatus> SimulatedExchangeClient::orderStatus(
    const std::string& exchange_order_id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(exchange_order_id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second.status;
}

std::optional<std::string> SimulatedExchangeClient::exchangeIdFor(
    const std::string& client_order_id) const {
  std::lock_guard lock(mutex_);
  auto it = by_client_id_.find(client_order_id);
  if (it == by_client_id_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace whalecopy
