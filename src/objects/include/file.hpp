#pragma once

#include <cstdint>
#include <string_view>

#include "fxt_string.hpp"
#include "reader.hpp"
#include "writer.hpp"

namespace fxt {

class File : public Reader, public Writer {
 public:
  enum class Type : int8_t { kCache, kStatic, kLog };
  enum class IfError : int8_t { kThrow, kNoThrow };

  File(std::string_view filePath, IfError ifError);

  File(std::string_view dataDir, Type type, std::string_view name, IfError ifError);

  [[nodiscard]] string readAll() const override;

  /// Writes data to the file, creating its parent directories if needed.
  int write(std::string_view data, Writer::Mode mode = Writer::Mode::FromStart) const override;

  bool exists() const;

  /// Removes the file if it exists. Returns true if a file has been removed.
  bool remove() const;

  std::string_view path() const noexcept { return _filePath; }

 private:
  string _filePath;
  IfError _ifError;
};

}  // namespace fxt
