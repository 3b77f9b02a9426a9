#include "general-config.hpp"

#include <string_view>

#include "file.hpp"
#include "fxt_const.hpp"
#include "read-json.hpp"

namespace fxt {

schema::GeneralConfig ReadGeneralConfig(std::string_view dataDir) {
  return ReadJsonOrCreateFile<schema::GeneralConfig>(
      File{dataDir, File::Type::kStatic, kGeneralConfigFileName, File::IfError::kNoThrow});
}

}  // namespace fxt
