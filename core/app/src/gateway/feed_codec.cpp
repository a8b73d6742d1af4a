#include "whalecopy/gateway/feed_codec.hpp"
#include "whalecopy/domain/enum_strings.hpp"
#include "whalecopy/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace whalecopy {

namespace {

template <typename T>
std::optional<T> optionalField(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

std::int64_t timestampOf(const nlohmann::json& j) {
  return optionalField<std::int64_t>(j, "timestamp_ms").value_or(0);
}

std::vector<domain::PriceLevel> levels(const nlohmann::json& j) {
  std::vector<domain::PriceLevel> result;
  for (const auto& level : j) {
    result.push_back(domain::PriceLevel{level.at(0).get<double>(),
                                        level.at(1).get<double>()});
  }
  return result;
}

WhaleTradeEvent decodeWhaleTrade(const nlohmann::json& j) {
  WhaleTradeEvent event;
  domain::WhaleTrade& t = event.trade;
  t.whale_address = j.at("whale_address").get<std::string>();
  t.market_id = j.at("market_id").get<std::string>();
  t.token_id = j.at("token_id").get<std::string>();

  const std::string side = j.at("side").get<std::string>();
  const auto parsed_side = domain::parseSide(side);
  if (!parsed_side) {
    throw std::invalid_argument("unknown side: " + side);
  }
  t.side = *parsed_side;

  const std::string outcome = j.value("outcome", std::string("YES"));
  const auto parsed_outcome = domain::parseOutcome(outcome);
  if (!parsed_outcome) {
    throw std::invalid_argument("unknown outcome: " + outcome);
  }
  t.outcome = *parsed_outcome;

  t.size = j.at("size").get<double>();
  t.price = j.at("price").get<double>();
  t.trade_id = j.at("trade_id").get<std::string>();
  t.timestamp_ms = timestampOf(j);
  event.timestamp = ms_to_timestamp(t.timestamp_ms);
  return event;
}

PriceUpdateEvent decodePrice(const nlohmann::json& j) {
  PriceUpdateEvent event;
  event.token_id = j.at("token_id").get<std::string>();
  event.price = j.at("price").get<double>();
  const std::int64_t ts = timestampOf(j);
  auto book = j.find("book");
  if (book != j.end() && !book->is_null()) {
    domain::OrderBook ob;
    ob.token_id = event.token_id;
    ob.bids = levels(book->at("bids"));
    ob.asks = levels(book->at("asks"));
    ob.timestamp_ms = ts;
    event.book = std::move(ob);
  }
  event.timestamp = ms_to_timestamp(ts);
  return event;
}

FillReport decodeFill(const nlohmann::json& j) {
  FillReport report;
  report.order_id = j.value("order_id", std::string());
  report.exchange_order_id = j.at("exchange_order_id").get<std::string>();
  report.filled_size = j.at("filled_size").get<double>();
  report.avg_price = j.at("avg_price").get<double>();
  report.fill_sequence = j.at("fill_sequence").get<std::uint64_t>();
  report.timestamp_ms = timestampOf(j);
  return report;
}

WhaleProfileEvent decodeWhaleProfile(const nlohmann::json& j) {
  WhaleProfileEvent event;
  domain::WhaleProfile& p = event.profile;
  p.address = j.at("address").get<std::string>();
  p.quality_score = optionalField<double>(j, "quality_score");
  p.sharpe_30d = optionalField<double>(j, "sharpe_30d");
  p.sharpe_90d = optionalField<double>(j, "sharpe_90d");
  p.current_drawdown = optionalField<double>(j, "current_drawdown");
  p.win_rate = optionalField<double>(j, "win_rate");
  p.updated_at_ms = timestampOf(j);
  event.timestamp = ms_to_timestamp(p.updated_at_ms);
  return event;
}

MarketInfoEvent decodeMarket(const nlohmann::json& j) {
  MarketInfoEvent event;
  event.market.market_id = j.at("market_id").get<std::string>();
  event.market.category = j.at("category").get<std::string>();
  event.market.resolution_time_ms = optionalField<std::int64_t>(j, "resolution_time_ms");
  event.market.active = j.value("active", true);
  event.timestamp = ms_to_timestamp(timestampOf(j));
  return event;
}

}  // namespace

FeedMessage decodeFeedMessage(const nlohmann::json& j) {
  const std::string type = j.at("type").get<std::string>();
  if (type == "whale_trade") {
    return Event{decodeWhaleTrade(j)};
  }
  if (type == "price") {
    return Event{decodePrice(j)};
  }
  if (type == "fill") {
    return decodeFill(j);
  }
  if (type == "whale_profile") {
    return Event{decodeWhaleProfile(j)};
  }
  if (type == "market") {
    return Event{decodeMarket(j)};
  }
  throw std::invalid_argument("unknown feed message type: " + type);
}

}  // namespace whalecopy
