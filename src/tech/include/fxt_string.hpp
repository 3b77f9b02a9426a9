#pragma once

#include <string>

namespace fxt {

using string = std::string;

}  // namespace fxt
