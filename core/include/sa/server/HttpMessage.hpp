#pragma once
#include "sa/api/Router.hpp"

#include <boost/beast/http.hpp>

#include <map>
#include <string>

namespace sa {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Decodes %XX escapes; '+' becomes a space when `plusAsSpace`.
// Returns false on a malformed escape.
bool percentDecode(const std::string& in, std::string& out, bool plusAsSpace);

// Splits "a=1&b=2" into decoded pairs. Later keys win.
bool parseQueryString(const std::string& query, std::map<std::string, std::string>& out);

// Maps a parsed request onto the router's view: method, decoded path and
// query. Accepts HTTP/1.0 and HTTP/1.1 with an origin-form ("/path"),
// absolute-form ("http://host/path") or "*" target.
bool toApiRequest(const HttpRequest& req, ApiRequest& out);

// JSON body with Content-Type/Content-Length, CORS headers and
// Connection: close. A 204 carries neither body nor content headers.
HttpResponse makeHttpResponse(const ApiResponse& resp, unsigned version = 11);

} // namespace sa
