#include "matchcore/domain/order.hpp"

namespace matchcore {
namespace domain {

const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "buy";
    case Side::Sell: return "sell";
  }
  return "unknown";
}

std::optional<Side> parseSide(std::string_view text) {
  if (text == "buy") return Side::Buy;
  if (text == "sell") return Side::Sell;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// isWellFormedSymbol: printable ASCII (0x21..0x7E), 1..kMaxSymbolLength chars
// -----------------------------------------------------------------------------
bool isWellFormedSymbol(std::string_view symbol) {
  if (symbol.empty() || symbol.size() > kMaxSymbolLength) {
    return false;
  }
  for (char c : symbol) {
    if (c <= ' ' || c > '~') {
      return false;
    }
  }
  return true;
}

}  // namespace domain
}  // namespace matchcore
