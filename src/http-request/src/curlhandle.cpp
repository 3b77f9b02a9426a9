#include "curlhandle.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <new>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <type_traits>

#include "curloptions.hpp"
#include "durationstring.hpp"
#include "fxt_exception.hpp"
#include "fxt_log.hpp"
#include "fxt_string.hpp"
#include "httprequesttype.hpp"
#include "permanentcurloptions.hpp"
#include "runmodes.hpp"
#include "timedef.hpp"

namespace fxt {

namespace {

size_t CurlWriteCallback(const char *contents, size_t size, size_t nmemb, void *userp) {
  try {
    reinterpret_cast<string *>(userp)->append(contents, size * nmemb);
  } catch (const std::bad_alloc &e) {
    // Do not throw exceptions in a function passed to a C library
    // Returning 0 is a magic number that will cause CURL to raise an error
    log::error("Bad alloc caught in curl write call back action, returning 0: {}", e.what());
    return 0;
  }
  return size * nmemb;
}

template <class T>
void CurlSetLogIfError(CURL *curl, CURLoption curlOption, T value) {
  static_assert(std::is_integral_v<T> || std::is_pointer_v<T>);
  const CURLcode code = curl_easy_setopt(curl, curlOption, value);
  if (code != CURLE_OK) {
    if constexpr (std::is_integral_v<T> || std::is_same_v<T, const char *>) {
      log::error("Curl error {} setting option {} to {}", static_cast<int>(code), static_cast<int>(curlOption), value);
    } else {
      log::error("Curl error {} setting option {}", static_cast<int>(code), static_cast<int>(curlOption));
    }
  }
}
}  // namespace

string GetCurlVersionInfo() {
  const curl_version_info_data &curlVersionInfo = *curl_version_info(CURLVERSION_NOW);

  string curlVersionInfoStr("curl ");
  curlVersionInfoStr.append(curlVersionInfo.version);
  if (curlVersionInfo.ssl_version == nullptr) {
    throw exception("Invalid curl install - no ssl support");
  }
  curlVersionInfoStr.append(" ssl ").append(curlVersionInfo.ssl_version);
  if (curlVersionInfo.libz_version != nullptr) {
    curlVersionInfoStr.append(" libz ").append(curlVersionInfo.libz_version);
  } else {
    curlVersionInfoStr.append(" NO libz support");
  }
  return curlVersionInfoStr;
}

CurlHandle::CurlHandle(std::string_view baseUrl, const PermanentCurlOptions &permanentCurlOptions,
                       settings::RunMode runMode)
    : _baseUrl(baseUrl),
      _requestCallLogLevel(permanentCurlOptions.requestCallLogLevel()),
      _requestAnswerLogLevel(permanentCurlOptions.requestAnswerLogLevel()),
      _nbMaxRetries(permanentCurlOptions.nbMaxRetries()) {
  if (!settings::AreQueryResponsesOverriden(runMode)) {
    CURL *curl = curl_easy_init();
    if (curl == nullptr) {
      throw std::bad_alloc();
    }

    _handle = curl;

    string userAgent = "fxtrack ";
    userAgent.append(FXT_VERSION);
    userAgent.append(", ");
    userAgent.append(GetCurlVersionInfo());

    CurlSetLogIfError(curl, CURLOPT_USERAGENT, userAgent.c_str());
    CurlSetLogIfError(curl, CURLOPT_WRITEFUNCTION, CurlWriteCallback);
    CurlSetLogIfError(curl, CURLOPT_WRITEDATA, &_queryData);
    const string &acceptedEncoding = permanentCurlOptions.getAcceptedEncoding();
    if (!acceptedEncoding.empty()) {
      CurlSetLogIfError(curl, CURLOPT_ACCEPT_ENCODING, acceptedEncoding.c_str());
    }

    // HTTP status codes >= 400 are reported as errors, and retried as such
    CurlSetLogIfError(curl, CURLOPT_FAILONERROR, 1L);

    // Needed for timeouts to work in multi threaded programs
    CurlSetLogIfError(curl, CURLOPT_NOSIGNAL, 1L);

    const auto requestTimeout = permanentCurlOptions.requestTimeout();
    if (requestTimeout > Duration::zero()) {
      CurlSetLogIfError(curl, CURLOPT_TIMEOUT_MS,
                        static_cast<long>(std::chrono::duration_cast<milliseconds>(requestTimeout).count()));
    }

    log::debug("Initialize CurlHandle for {} with {} retries of {}", _baseUrl, _nbMaxRetries,
               DurationToString(permanentCurlOptions.requestTimeout()));
  }
}

std::string_view CurlHandle::query(std::string_view endpoint, const CurlOptions &opts) {
  if (_handle == nullptr) {
    // Query response override mode
    const auto it = _overridenQueryResponses.find(string(endpoint));
    if (it == _overridenQueryResponses.end()) {
      throw exception("No response for path '{}'", endpoint);
    }
    _queryData = it->second;
    return _queryData;
  }

  string modifiedURL(_baseUrl);
  modifiedURL.append(endpoint);

  CURL *curl = reinterpret_cast<CURL *>(_handle);

  CurlSetLogIfError(curl, CURLOPT_URL, modifiedURL.c_str());

  // Important! We should reset ALL fields of curl object that may change for each call to query
  // as we don't reset curl options for each query
  CurlSetLogIfError(curl, CURLOPT_POST, opts.requestType() == HttpRequestType::kPost ? 1L : 0L);
  if (opts.requestType() == HttpRequestType::kGet) {
    // This is to force cURL to switch in a GET request
    CurlSetLogIfError(curl, CURLOPT_HTTPGET, 1L);
  }

  curl_slist *curlListPtr = nullptr;
  for (const string &httpHeader : opts.httpHeaders()) {
    curl_slist *newCurlListPtr = curl_slist_append(curlListPtr, httpHeader.c_str());
    if (newCurlListPtr == nullptr) {
      curl_slist_free_all(curlListPtr);
      throw std::bad_alloc();
    }
    curlListPtr = newCurlListPtr;
  }

  using CurlSlistDeleter = decltype([](curl_slist *hdrList) { curl_slist_free_all(hdrList); });
  using CurlListUniquePtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

  CurlListUniquePtr curlListUniquePtr(curlListPtr);

  CurlSetLogIfError(curl, CURLOPT_HTTPHEADER, curlListPtr);

  log::log(_requestCallLogLevel, "{} {}", HttpRequestTypeToString(opts.requestType()), modifiedURL);

  // Actually make the query, with a fast retry mechanism
  Duration sleepingTime = milliseconds(100);
  int retryPos = 0;
  CURLcode res;

  do {
    if (retryPos != 0) {
      log::error("Got curl error ({}: {}), retry {}/{} after {}", static_cast<int>(res), curl_easy_strerror(res),
                 retryPos, _nbMaxRetries, DurationToString(sleepingTime));
      std::this_thread::sleep_for(sleepingTime);
      sleepingTime *= 2;
    }

    _queryData.clear();

    const auto t1 = Clock::now();

    // Call
    res = curl_easy_perform(curl);

    log::trace("{} answered in {} ms", modifiedURL, GetTimeFrom<milliseconds>(t1).count());

  } while (res != CURLE_OK && ++retryPos <= _nbMaxRetries);
  if (res != CURLE_OK) {
    throw exception("Too many errors from curl for {}, last ({}: {})", modifiedURL, static_cast<int>(res),
                    curl_easy_strerror(res));
  }

  // Avoid polluting the logs for large response which are more likely to be HTML
  const bool mayBeJsonResponse = _queryData.starts_with('{') || _queryData.starts_with('[');
  static constexpr std::size_t kMaxLenResponse = 1000;
  if (!mayBeJsonResponse && _queryData.size() > kMaxLenResponse) {
    const std::string_view outPrinted(_queryData.data(), std::min(_queryData.size(), kMaxLenResponse));
    log::log(_requestAnswerLogLevel, "Truncated non JSON response {}...", outPrinted);
  } else {
    log::log(_requestAnswerLogLevel, "Full{}JSON response {}", mayBeJsonResponse ? " " : " non ", _queryData);
  }

  return _queryData;
}

void CurlHandle::setOverridenQueryResponses(const std::map<string, string> &queryResponsesMap) {
  if (_handle != nullptr) {
    throw exception(
        "CurlHandle should be created in Query response override mode in order to override its next response");
  }
  _overridenQueryResponses = queryResponsesMap;
}

CurlHandle::~CurlHandle() {
  if (_handle != nullptr) {
    curl_easy_cleanup(reinterpret_cast<CURL *>(_handle));
  }
}

CurlInitRAII::CurlInitRAII() {
  CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (code != CURLE_OK) {
    throw exception("curl_global_init() failed: {}", curl_easy_strerror(code));
  }
}

CurlInitRAII::~CurlInitRAII() { curl_global_cleanup(); }

}  // namespace fxt
