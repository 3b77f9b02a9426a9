#include "currencypair.hpp"

#include <string_view>

#include "fxt_invalid_argument_exception.hpp"
#include "fxt_string.hpp"

namespace fxt {

CurrencyPair::CurrencyPair(std::string_view pairStrRep, char currencyCodeSep) {
  const auto sepPos = pairStrRep.find(currencyCodeSep);
  if (sepPos == std::string_view::npos || sepPos == 0 || sepPos + 1 == pairStrRep.size()) {
    throw invalid_argument("Currency pair '{}' should be composed of 2 currencies separated by '{}'", pairStrRep,
                           currencyCodeSep);
  }
  if (pairStrRep.find(currencyCodeSep, sepPos + 1) != std::string_view::npos) {
    throw invalid_argument("Currency pair '{}' should contain a single '{}'", pairStrRep, currencyCodeSep);
  }
  _from = CurrencyCode(pairStrRep.substr(0, sepPos));
  _to = CurrencyCode(pairStrRep.substr(sepPos + 1));
}

string CurrencyPair::str(char sep) const {
  string ret;
  ret.reserve(_from.size() + _to.size() + 1U);
  ret.append(_from);
  ret.push_back(sep);
  ret.append(_to);
  return ret;
}

}  // namespace fxt
