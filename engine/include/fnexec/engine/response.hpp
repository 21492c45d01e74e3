#ifndef FNEXEC_ENGINE_RESPONSE_HPP
#define FNEXEC_ENGINE_RESPONSE_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <json/value.h>

namespace fnexec::engine {

  // The {statusCode, headers, body} triple every invocation ends with,
  // whatever shape the handler returned.
  struct CanonicalResponse {

    static constexpr int DEFAULT_STATUS_CODE = 200;

    int status_code = DEFAULT_STATUS_CODE;
    std::map<std::string, std::string> headers;
    std::string body;

    Json::Value to_json() const;

    bool operator==(const CanonicalResponse&) const = default;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Coerces an arbitrary JSON value into the canonical response.
  ///
  /// statusCode: integral numbers and numeric strings are accepted when they fit
  /// a non-negative int (fractions are truncated); anything else gives 200.
  /// headers: only a JSON object is accepted. String values are kept, other
  /// scalars are converted to their JSON text, null becomes an empty string and
  /// nested values are serialized.
  /// body: strings are kept, anything else (including a missing body) is
  /// serialized to compact JSON.
  ///
  /// Never throws.
  ////////////////////////////////////////////////////////////////////////////////
  CanonicalResponse normalize(const Json::Value& raw) noexcept;

  // 500-class response of the form {"error": message}.
  CanonicalResponse error_response(std::string_view message, int status_code = 500);

  namespace json {

    // Compact, UTF-8 preserving serialization.
    std::string write(const Json::Value& value);

    // Parses a complete JSON document; returns std::nullopt and sets the
    // error message on failure.
    std::optional<Json::Value> parse(std::string_view text, std::string* error = nullptr);

  } // namespace json

} // namespace fnexec::engine

#endif
