#include "sa/server/HttpMessage.hpp"

namespace sa {

namespace http = boost::beast::http;

static int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool percentDecode(const std::string& in, std::string& out, bool plusAsSpace) {
  std::string result;
  result.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); i++) {
    char c = in[i];
    if (c == '%') {
      if (i + 2 >= in.size()) return false;
      int hi = hexValue(in[i + 1]);
      int lo = hexValue(in[i + 2]);
      if (hi < 0 || lo < 0) return false;
      result += static_cast<char>(hi * 16 + lo);
      i += 2;
    } else if (c == '+' && plusAsSpace) {
      result += ' ';
    } else {
      result += c;
    }
  }
  out = std::move(result);
  return true;
}

bool parseQueryString(const std::string& query, std::map<std::string, std::string>& out) {
  std::size_t pos = 0;
  while (pos <= query.size()) {
    std::size_t amp = query.find('&', pos);
    if (amp == std::string::npos) amp = query.size();
    std::string pair = query.substr(pos, amp - pos);
    if (!pair.empty()) {
      std::size_t eq = pair.find('=');
      std::string key, value;
      if (!percentDecode(pair.substr(0, eq), key, true)) return false;
      if (eq != std::string::npos &&
          !percentDecode(pair.substr(eq + 1), value, true)) {
        return false;
      }
      out[key] = value;
    }
    pos = amp + 1;
  }
  return true;
}

bool toApiRequest(const HttpRequest& req, ApiRequest& out) {
  if (req.version() != 10 && req.version() != 11) return false;

  auto method = req.method_string();
  auto rawTarget = req.target();
  if (method.empty() || rawTarget.empty()) return false;
  std::string target(rawTarget.data(), rawTarget.size());

  // Absolute-form targets keep only the path part.
  if (target.compare(0, 7, "http://") == 0 || target.compare(0, 8, "https://") == 0) {
    std::size_t slash = target.find('/', target.find("//") + 2);
    target = slash == std::string::npos ? "/" : target.substr(slash);
  }
  if (target[0] != '/' && target != "*") return false;

  ApiRequest api;
  api.method.assign(method.data(), method.size());

  std::size_t q = target.find('?');
  if (!percentDecode(target.substr(0, q), api.path, false)) return false;
  if (q != std::string::npos && !parseQueryString(target.substr(q + 1), api.query)) {
    return false;
  }

  out = std::move(api);
  return true;
}

HttpResponse makeHttpResponse(const ApiResponse& resp, unsigned version) {
  HttpResponse res{static_cast<http::status>(resp.status), version};
  res.set(http::field::server, "StockAnalyzer");
  res.set(http::field::access_control_allow_origin, "*");
  res.set(http::field::access_control_allow_credentials, "true");
  res.set(http::field::access_control_allow_methods, "GET, OPTIONS");
  res.set(http::field::access_control_allow_headers, "*");
  res.keep_alive(false);

  if (resp.status != 204) {
    res.set(http::field::content_type, "application/json");
    res.body() = resp.body;
    res.prepare_payload();
  }
  return res;
}

} // namespace sa
