#pragma once

#include <map>
#include <string_view>

#include "fxt_log.hpp"
#include "fxt_string.hpp"
#include "permanentcurloptions.hpp"
#include "runmodes.hpp"

namespace fxt {

class CurlOptions;

// Get a string returning runtime curl version information.
string GetCurlVersionInfo();

/// RAII class safely managing a CURL handle.
///
/// Aim of this class is to simplify curl library complexity usage, and abstracts it from client
///
/// Note that this implementation is not thread-safe. It is recommended to embed an instance of
/// CurlHandle for faster similar queries.
class CurlHandle {
 public:
  /// Constructs a new CurlHandle.
  /// @param baseUrl prefix of all queries made by this handle
  /// @param permanentCurlOptions curl options applied once and for all requests of this CurlHandle
  /// @param runMode run mode
  explicit CurlHandle(std::string_view baseUrl,
                      const PermanentCurlOptions &permanentCurlOptions = PermanentCurlOptions(),
                      settings::RunMode runMode = settings::RunMode::kProd);

  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  CurlHandle(CurlHandle &&) = delete;
  CurlHandle &operator=(CurlHandle &&) = delete;

  ~CurlHandle();

  /// Launch a query on the given endpoint, it should start with a '/' and not contain the base URL given at
  /// creation of this object.
  /// Response is returned as a std::string_view to a memory hold in cache by this CurlHandle.
  /// The pointed memory is valid until a next call to 'query'.
  std::string_view query(std::string_view endpoint, const CurlOptions &opts);

  [[nodiscard]] std::string_view baseUrl() const { return _baseUrl; }

  /// Instead of actually performing real calls, instructs this CurlHandle to
  /// return hardcoded responses (in values of given map) based on query endpoints (in key of given map).
  /// This should be used only for tests purposes.
  void setOverridenQueryResponses(const std::map<string, string> &queryResponsesMap);

 private:
  // void pointer instead of CURL to avoid having to forward declare (we don't know about the underlying definition)
  // and to avoid clients to pull unnecessary curl dependencies by just including the header
  void *_handle = nullptr;
  string _baseUrl;
  string _queryData;
  std::map<string, string> _overridenQueryResponses;
  log::level::level_enum _requestCallLogLevel = log::level::off;
  log::level::level_enum _requestAnswerLogLevel = log::level::off;
  int _nbMaxRetries = PermanentCurlOptions::kDefaultNbMaxRetries;
};

// Simple RAII class managing global init and clean up of Curl library.
// It's in the same file as CurlHandle so that only one source file has a dependency on curl sources.
struct CurlInitRAII {
  [[nodiscard]] CurlInitRAII();

  CurlInitRAII(const CurlInitRAII &) = delete;
  CurlInitRAII &operator=(const CurlInitRAII &) = delete;

  CurlInitRAII(CurlInitRAII &&) = delete;
  CurlInitRAII &operator=(CurlInitRAII &&) = delete;

  ~CurlInitRAII();
};
}  // namespace fxt
