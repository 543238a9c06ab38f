/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/uri.hpp"

#include <algorithm>
#include <cctype>

namespace slotwatch::common {

  std::string Uri::toString() const {
    std::string result;
    if (not Schema.empty()) {
      result += Schema;
      result += "://";
    }
    result += Host;
    if (not Port.empty()) {
      result += ":";
      result += Port;
    }
    result += Path;
    return result;
  }

  Uri Uri::parse(std::string_view uri) {
    Uri result;

    if (uri.empty()) {
      result.error_.emplace("Empty uri");
      return result;
    }

    // Schema
    std::string_view rest = uri;
    if (auto pos = rest.find("://"); pos != std::string_view::npos) {
      result.Schema.assign(rest.substr(0, pos));
      rest.remove_prefix(pos + 3);
      if (result.Schema.empty()
          or std::find_if_not(result.Schema.begin(),
                              result.Schema.end(),
                              [](unsigned char ch) { return std::isalpha(ch); })
                 != result.Schema.end()) {
        result.error_.emplace("Invalid schema");
      }
    }

    // Host
    const auto host_end = rest.find_first_of(":/");
    result.Host.assign(rest.substr(0, host_end));
    if (result.Host.empty()
        or std::find_if_not(result.Host.begin(),
                            result.Host.end(),
                            [](unsigned char ch) {
                              return std::isalnum(ch) or ch == '.' or ch == '-';
                            })
               != result.Host.end()) {
      if (not result.error_.has_value()) {
        result.error_.emplace("Invalid hostname");
      }
    }
    rest.remove_prefix(host_end == std::string_view::npos ? rest.size()
                                                          : host_end);

    // Port
    if (rest.starts_with(':')) {
      rest.remove_prefix(1);
      const auto port_end = rest.find('/');
      result.Port.assign(rest.substr(0, port_end));
      rest.remove_prefix(port_end == std::string_view::npos ? rest.size()
                                                            : port_end);
      if (result.Port.empty() or result.Port == "0" or result.Port.size() > 5
          or (result.Port.size() == 5 and result.Port > "65535")
          or std::find_if_not(result.Port.begin(),
                              result.Port.end(),
                              [](unsigned char ch) { return std::isdigit(ch); })
                 != result.Port.end()) {
        if (not result.error_.has_value()) {
          result.error_.emplace("Invalid port");
        }
      }
    }

    // Path
    result.Path.assign(rest);

    return result;
  }

}  // namespace slotwatch::common
