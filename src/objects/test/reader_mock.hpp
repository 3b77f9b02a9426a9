#pragma once

#include <gmock/gmock.h>

#include "fxt_string.hpp"
#include "reader.hpp"

namespace fxt {

class MockReader : public Reader {
 public:
  MOCK_METHOD(string, readAll, (), (const override));
};

}  // namespace fxt
