#pragma once

#include "whalecopy/events/event.hpp"
#include "whalecopy/execution/i_exchange_client.hpp"

#include <nlohmann/json.hpp>

#include <variant>

namespace whalecopy {

// A decoded feed message: an engine event for the signal loop, or a push
// fill for OrderExecutor::onFillReport().
using FeedMessage = std::variant<Event, FillReport>;

// -----------------------------------------------------------------------------
// decodeFeedMessage(j)
// -----------------------------------------------------------------------------
//
// @brief  Turns one JSON feed message into a FeedMessage.
//
// @details
// The "type" field selects the layout:
//
//   whale_trade    { whale_address, market_id, token_id, side: "BUY"|"SELL",
//                    outcome: "YES"|"NO", size, price, trade_id,
//                    timestamp_ms }
//   price          { token_id, price, book?: { bids: [[p, s], ...],
//                    asks: [[p, s], ...] }, timestamp_ms? }
//   fill           { order_id?, exchange_order_id, filled_size, avg_price,
//                    fill_sequence, timestamp_ms? }
//   whale_profile  { address, quality_score?, sharpe_30d?, sharpe_90d?,
//                    current_drawdown?, win_rate?, timestamp_ms? }
//   market         { market_id, category, resolution_time_ms?, active? }
//
// Optional fields may be absent or null. A missing required field or a
// wrong JSON type throws nlohmann::json::exception; an unknown "type" or
// enum name throws std::invalid_argument.
// -----------------------------------------------------------------------------
FeedMessage decodeFeedMessage(const nlohmann::json& j);

}  // namespace whalecopy
