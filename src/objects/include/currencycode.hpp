#pragma once

#include "fxt_string.hpp"

namespace fxt {

/// Currency codes are opaque keys ("EUR", "USD"...), compared case sensitively.
/// Unknown codes are accepted everywhere: they just never match any rate.
using CurrencyCode = string;

}  // namespace fxt
