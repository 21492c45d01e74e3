#include <fnexec/engine/response.hpp>

#include <charconv>
#include <cmath>
#include <limits>
#include <memory>

#include <json/json.h>

namespace fnexec::engine {

  namespace {

    constexpr int MAX_STATUS = std::numeric_limits<int>::max();

    std::optional<int> from_real(double value)
    {
      if (!std::isfinite(value) || value < 0 || value >= static_cast<double>(MAX_STATUS) + 1) {
        return std::nullopt;
      }
      return static_cast<int>(value);
    }

    std::optional<int> from_string(std::string_view text)
    {
      size_t begin = text.find_first_not_of(" \t\r\n");
      if (begin == std::string_view::npos) {
        return std::nullopt;
      }
      size_t end = text.find_last_not_of(" \t\r\n");
      text = text.substr(begin, end - begin + 1);

      double value{};
      auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
      if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
      }
      return from_real(value);
    }

    std::optional<int> status_code(const Json::Value& value)
    {
      switch (value.type()) {
      case Json::intValue: {
        auto val = value.asLargestInt();
        if (val < 0 || val > MAX_STATUS) {
          return std::nullopt;
        }
        return static_cast<int>(val);
      }
      case Json::uintValue: {
        auto val = value.asLargestUInt();
        if (val > static_cast<Json::LargestUInt>(MAX_STATUS)) {
          return std::nullopt;
        }
        return static_cast<int>(val);
      }
      case Json::realValue:
        return from_real(value.asDouble());
      case Json::stringValue:
        return from_string(value.asString());
      default:
        return std::nullopt;
      }
    }

    std::string header_value(const Json::Value& value)
    {
      if (value.isString()) {
        return value.asString();
      }
      if (value.isNull()) {
        return "";
      }
      return json::write(value);
    }

    std::string body_text(const Json::Value& value)
    {
      if (value.isString()) {
        return value.asString();
      }
      try {
        return json::write(value);
      } catch (std::exception& exc) {
        return std::string{"[unserializable body: "} + exc.what() + "]";
      }
    }

  } // namespace

  Json::Value CanonicalResponse::to_json() const
  {
    Json::Value json{Json::objectValue};
    json["statusCode"] = status_code;

    Json::Value headers_json{Json::objectValue};
    for (const auto& [key, value] : headers) {
      headers_json[key] = value;
    }
    json["headers"] = std::move(headers_json);
    json["body"] = body;

    return json;
  }

  CanonicalResponse normalize(const Json::Value& raw) noexcept
  {
    CanonicalResponse response;

    try {

      if (!raw.isObject()) {
        response.body = "null";
        return response;
      }

      if (raw.isMember("statusCode")) {
        response.status_code =
            status_code(raw["statusCode"]).value_or(CanonicalResponse::DEFAULT_STATUS_CODE);
      }

      const Json::Value& headers = raw["headers"];
      if (headers.isObject()) {
        for (const auto& name : headers.getMemberNames()) {
          response.headers[name] = header_value(headers[name]);
        }
      }

      response.body = body_text(raw["body"]);

    } catch (std::exception&) {
      // Only allocation failures can end up here; keep whatever was extracted.
      if (response.body.empty()) {
        response.body = "null";
      }
    }

    return response;
  }

  CanonicalResponse error_response(std::string_view message, int status_code)
  {
    Json::Value body{Json::objectValue};
    body["error"] = std::string{message};

    CanonicalResponse response;
    response.status_code = status_code;
    response.headers["content-type"] = "application/json";
    response.body = json::write(body);

    return response;
  }

  namespace json {

    std::string write(const Json::Value& value)
    {
      Json::StreamWriterBuilder builder;
      builder["indentation"] = "";
      builder["emitUTF8"] = true;
      builder["precision"] = 16;
      return Json::writeString(builder, value);
    }

    std::optional<Json::Value> parse(std::string_view text, std::string* error)
    {
      Json::CharReaderBuilder builder;
      builder["collectComments"] = false;
      builder["failIfExtra"] = true;
      std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};

      Json::Value root;
      std::string errors;
      if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        if (error) {
          *error = errors;
        }
        return std::nullopt;
      }
      return root;
    }

  } // namespace json

} // namespace fnexec::engine
