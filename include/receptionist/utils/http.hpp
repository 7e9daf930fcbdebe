#pragma once

#include <map>
#include <string>

namespace receptionist::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path);

std::string join_path(const std::string& base_path, const std::string& path);

std::string url_encode(const std::string& value);
std::string url_decode(const std::string& value);

// Splits "a=1&b=2" (an optional leading path and '?' are skipped).
std::map<std::string, std::string> parse_query(const std::string& target);

}
