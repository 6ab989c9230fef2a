#include "paper/network/message_codec.hpp"

#include <nlohmann/json.hpp>

namespace paper {

namespace {

template <typename T>
T valueOr(const nlohmann::json& j, const char* key, T fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return it->get<T>();
}

Error invalid(const std::string& why) {
  return makeError(ErrorKind::InvalidSignal, why);
}

Result<InboundMessage> decodeSignal(const nlohmann::json& j) {
  domain::Signal s;
  s.market_id = j.at("market_id").get<std::string>();
  if (!domain::parseSide(j.at("side").get<std::string>(), s.side)) {
    return invalid("unknown side for market " + s.market_id);
  }
  s.probability = j.at("probability").get<double>();
  s.market_price = j.at("market_price").get<double>();
  s.edge = j.at("edge").get<double>();

  const auto confidence = valueOr<std::string>(j, "confidence", "MEDIUM");
  if (!domain::parseConfidence(confidence, s.confidence)) {
    return invalid("unknown confidence " + confidence);
  }

  s.timestamp_ms = valueOr<std::int64_t>(j, "timestamp_ms", 0);
  s.horizon_ms = valueOr<std::int64_t>(j, "horizon_ms", 0);
  s.liquidity = valueOr<double>(j, "liquidity", 0.0);
  return InboundMessage{std::move(s)};
}

Result<InboundMessage> decodeMarket(const nlohmann::json& j) {
  domain::MarketUpdate u;
  u.market_id = j.at("market_id").get<std::string>();
  u.yes_price = j.at("yes_price").get<double>();
  u.liquidity = valueOr<double>(j, "liquidity", 0.0);
  u.timestamp_ms = valueOr<std::int64_t>(j, "timestamp_ms", 0);
  return InboundMessage{std::move(u)};
}

Result<InboundMessage> decodeResolution(const nlohmann::json& j) {
  domain::MarketResolution r;
  r.market_id = j.at("market_id").get<std::string>();
  if (!domain::parseSide(j.at("outcome").get<std::string>(), r.outcome)) {
    return invalid("unknown outcome for market " + r.market_id);
  }
  r.timestamp_ms = valueOr<std::int64_t>(j, "timestamp_ms", 0);
  return InboundMessage{std::move(r)};
}

}  // namespace

Result<InboundMessage> MessageCodec::decode(const std::string& payload) {
  try {
    const auto j = nlohmann::json::parse(payload);
    const auto type = j.at("type").get<std::string>();

    if (type == "signal") {
      return decodeSignal(j);
    }
    if (type == "market") {
      return decodeMarket(j);
    }
    if (type == "resolution") {
      return decodeResolution(j);
    }
    return invalid("unknown message type " + type);
  } catch (const nlohmann::json::exception& e) {
    return invalid(std::string("malformed message: ") + e.what());
  }
}

const std::string& MessageCodec::marketOf(const InboundMessage& message) {
  if (const auto* s = std::get_if<domain::Signal>(&message)) {
    return s->market_id;
  }
  if (const auto* u = std::get_if<domain::MarketUpdate>(&message)) {
    return u->market_id;
  }
  return std::get<domain::MarketResolution>(message).market_id;
}

}  // namespace paper
