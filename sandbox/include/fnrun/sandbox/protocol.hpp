#ifndef FNRUN_SANDBOX_PROTOCOL_HPP
#define FNRUN_SANDBOX_PROTOCOL_HPP

#include <fnrun/sandbox/result.hpp>

#include <string>
#include <string_view>
#include <vector>

#include <json/value.h>

// Messages exchanged between the runner and the sandbox host.
// The runner writes one request to the stdin of the sandbox, and the sandbox
// answers with one result document on the dedicated result descriptor.
namespace fnrun::sandbox::protocol {

  struct Request {
    std::string source;
    std::string entry_point;

    // JSON object of keyword arguments.
    Json::Value arguments{Json::objectValue};

    // Top-level modules the sandboxed code may import.
    std::vector<std::string> allowed_modules;
  };

  std::string serialize(const Json::Value& value);

  Json::Value parse(std::string_view data);

  std::string encode(const Request& request);

  // Throws common::InvalidJSON on malformed input.
  Request decode_request(std::string_view data);

  std::string encode(const InvocationResult& result);

  // Throws common::InvalidJSON on malformed input.
  InvocationResult decode_result(std::string_view data);

} // namespace fnrun::sandbox::protocol

#endif
