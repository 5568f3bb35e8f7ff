#include <fnrun/sandbox/protocol.hpp>

#include <fnrun/common/exceptions.hpp>

#include <memory>

#include <fmt/format.h>
#include <json/reader.h>
#include <json/writer.h>

namespace fnrun::sandbox::protocol {

  std::string serialize(const Json::Value& value)
  {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    builder["precision"] = 17;
    return Json::writeString(builder, value);
  }

  Json::Value parse(std::string_view data)
  {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};

    Json::Value value;
    std::string errors;
    if (!reader->parse(data.data(), data.data() + data.size(), &value, &errors)) {
      throw common::InvalidJSON(fmt::format("Could not parse JSON: {}", errors));
    }
    return value;
  }

  std::string encode(const Request& request)
  {
    Json::Value json{Json::objectValue};
    json["source"] = request.source;
    json["entry_point"] = request.entry_point;
    json["arguments"] = request.arguments;

    Json::Value modules{Json::arrayValue};
    for (const std::string& module : request.allowed_modules) {
      modules.append(module);
    }
    json["allowed_modules"] = modules;

    return serialize(json);
  }

  Request decode_request(std::string_view data)
  {
    Json::Value json = parse(data);
    if (!json.isObject()) {
      throw common::InvalidJSON("Sandbox request must be a JSON object");
    }

    if (!json["source"].isString() || !json["entry_point"].isString()) {
      throw common::InvalidJSON("Sandbox request requires string fields source and entry_point");
    }

    Request req;
    req.source = json["source"].asString();
    req.entry_point = json["entry_point"].asString();

    if (json.isMember("arguments")) {
      if (!json["arguments"].isObject()) {
        throw common::InvalidJSON("Sandbox arguments must be a JSON object");
      }
      req.arguments = json["arguments"];
    }

    const Json::Value& modules = json["allowed_modules"];
    if (!modules.isNull() && !modules.isArray()) {
      throw common::InvalidJSON("Allowed modules must be a JSON array");
    }
    for (const Json::Value& module : modules) {
      if (!module.isString()) {
        throw common::InvalidJSON("Allowed modules must be strings");
      }
      req.allowed_modules.push_back(module.asString());
    }

    return req;
  }

  std::string encode(const InvocationResult& result)
  {
    Json::Value json{Json::objectValue};

    if (const auto* success = std::get_if<Success>(&result)) {
      json["status"] = "success";
      json["result"] = success->value;
    } else {
      const auto& failure = std::get<Failure>(result);
      json["status"] = "failure";
      json["kind"] = std::string{kind_to_string(failure.kind)};
      json["message"] = failure.message;

      if (failure.kind == ErrorKind::NOT_FOUND) {
        Json::Value available{Json::arrayValue};
        for (const std::string& name : failure.available) {
          available.append(name);
        }
        json["available"] = available;
      }
    }

    return serialize(json);
  }

  InvocationResult decode_result(std::string_view data)
  {
    Json::Value json = parse(data);
    if (!json.isObject() || !json["status"].isString()) {
      throw common::InvalidJSON("Sandbox result must be an object with a status");
    }

    std::string status = json["status"].asString();
    if (status == "success") {
      if (!json.isMember("result")) {
        throw common::InvalidJSON("Sandbox result is missing the returned value");
      }
      return Success{json["result"]};
    }

    if (status != "failure" || !json["kind"].isString() || !json["message"].isString()) {
      throw common::InvalidJSON(fmt::format("Unknown sandbox result status {}", status));
    }

    Failure failure{string_to_kind(json["kind"].asString()), json["message"].asString()};
    const Json::Value& available = json["available"];
    if (available.isArray()) {
      for (const Json::Value& name : available) {
        if (name.isString()) {
          failure.available.push_back(name.asString());
        }
      }
    }
    return failure;
  }

} // namespace fnrun::sandbox::protocol
