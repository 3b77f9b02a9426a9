#pragma once

namespace fxt {

class CacheFileUpdatorInterface {
 public:
  virtual ~CacheFileUpdatorInterface() = default;

  virtual void updateCacheFile() const {}
};

}  // namespace fxt
