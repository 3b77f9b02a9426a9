#pragma once

#include "fxt_string.hpp"

namespace fxt {

class Reader {
 public:
  Reader() noexcept = default;

  virtual ~Reader() = default;

  // Read all content and return a string of it.
  [[nodiscard]] virtual string readAll() const { return {}; }
};

}  // namespace fxt
