// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file http_message.hpp
/// \brief HTTP/1.1 request and response structures used by the gateway's
/// server, plus URL decoding and query-string parsing helpers.

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ledgergate
{
namespace network
{

  enum class HttpMethod
  {
    GET,
    HEAD,
    POST,
    PUT,
    DELETE,
    PATCH,
    OPTIONS
  };

  inline std::string toString(HttpMethod method)
  {
    switch (method)
    {
    case HttpMethod::GET:
      return "GET";
    case HttpMethod::HEAD:
      return "HEAD";
    case HttpMethod::POST:
      return "POST";
    case HttpMethod::PUT:
      return "PUT";
    case HttpMethod::DELETE:
      return "DELETE";
    case HttpMethod::PATCH:
      return "PATCH";
    case HttpMethod::OPTIONS:
      return "OPTIONS";
    }
    return "GET";
  }

  /// \throws std::invalid_argument for methods the server does not know.
  inline HttpMethod parseMethod(const std::string &method)
  {
    static const std::pair<const char *, HttpMethod> kMethods[] = {
      {"GET", HttpMethod::GET},         {"HEAD", HttpMethod::HEAD},
      {"POST", HttpMethod::POST},       {"PUT", HttpMethod::PUT},
      {"DELETE", HttpMethod::DELETE},   {"PATCH", HttpMethod::PATCH},
      {"OPTIONS", HttpMethod::OPTIONS},
    };
    for (const auto &entry : kMethods)
    {
      if (method == entry.first)
      {
        return entry.second;
      }
    }
    throw std::invalid_argument("Unknown HTTP method: " + method);
  }

  /// \brief Case-insensitive string comparison for headers
  struct CaseInsensitiveCompare
  {
    bool operator()(const std::string &a, const std::string &b) const
    {
      return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y)
        {
          return std::tolower(static_cast<unsigned char>(x)) <
                 std::tolower(static_cast<unsigned char>(y));
        });
    }
  };

  using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveCompare>;

  /// \brief Ordered list of decoded query parameters.
  using QueryParams = std::vector<std::pair<std::string, std::string>>;

  inline std::string toLower(std::string s)
  {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  inline std::string trim(const std::string &s)
  {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos)
    {
      return {};
    }
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
  }

  /// \brief Percent-decode a URL component. With `plusAsSpace`, '+' becomes a
  /// space (form encoding, used for query strings). Malformed escapes are
  /// kept literally.
  inline std::string urlDecode(const std::string &s, bool plusAsSpace)
  {
    auto hexValue = [](char c) -> int
    {
      if (c >= '0' && c <= '9')
      {
        return c - '0';
      }
      if (c >= 'a' && c <= 'f')
      {
        return c - 'a' + 10;
      }
      if (c >= 'A' && c <= 'F')
      {
        return c - 'A' + 10;
      }
      return -1;
    };

    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i)
    {
      char c = s[i];
      if (c == '%' && i + 2 < s.size())
      {
        int hi = hexValue(s[i + 1]);
        int lo = hexValue(s[i + 2]);
        if (hi >= 0 && lo >= 0)
        {
          out += static_cast<char>((hi << 4) | lo);
          i += 2;
          continue;
        }
      }
      out += (plusAsSpace && c == '+') ? ' ' : c;
    }
    return out;
  }

  /// \brief Split a raw query string into decoded key/value pairs, keeping
  /// their original order. A key without '=' gets an empty value.
  inline QueryParams parseQuery(const std::string &query)
  {
    QueryParams params;
    std::size_t start = 0;
    while (start <= query.size())
    {
      std::size_t end = query.find('&', start);
      if (end == std::string::npos)
      {
        end = query.size();
      }
      std::string part = query.substr(start, end - start);
      if (!part.empty())
      {
        auto eq = part.find('=');
        if (eq == std::string::npos)
        {
          params.emplace_back(urlDecode(part, true), std::string{});
        }
        else
        {
          params.emplace_back(urlDecode(part.substr(0, eq), true),
                              urlDecode(part.substr(eq + 1), true));
        }
      }
      start = end + 1;
    }
    return params;
  }

  /// \brief A parsed HTTP request as handed to route handlers.
  struct HttpRequest
  {
    HttpMethod method{HttpMethod::GET};
    std::string target;  ///< Raw request target, e.g. "/state?address=00"
    std::string path;    ///< Target without the query string, not decoded
    std::string query;   ///< Raw query string without '?'
    QueryParams queryParams;
    std::string version{"HTTP/1.1"};
    HttpHeaders headers;
    std::string body;
    std::string scheme{"http"};
    std::string remoteAddr;
    std::map<std::string, std::string> pathParams;

    std::string getHeader(const std::string &name) const
    {
      auto it = headers.find(name);
      return it != headers.end() ? it->second : std::string{};
    }

    bool hasHeader(const std::string &name) const { return headers.find(name) != headers.end(); }

    /// \brief First value of a query parameter, if present.
    std::optional<std::string> queryParam(const std::string &name) const
    {
      for (const auto &kv : queryParams)
      {
        if (kv.first == name)
        {
          return kv.second;
        }
      }
      return std::nullopt;
    }

    std::string pathParam(const std::string &name) const
    {
      auto it = pathParams.find(name);
      return it != pathParams.end() ? it->second : std::string{};
    }

    /// \brief Host as sent by the client, including any port.
    std::string host() const { return getHeader("Host"); }

    /// \brief Absolute URL of this request as the client addressed it.
    std::string url() const { return scheme + "://" + host() + target; }

    /// \brief Parse the request line and header block (everything before
    /// the blank line). The body is attached by the caller.
    /// \throws std::invalid_argument on a malformed request line.
    static HttpRequest parseHead(const std::string &head)
    {
      HttpRequest request;
      std::istringstream stream(head);
      std::string line;
      bool firstLine = true;
      while (std::getline(stream, line))
      {
        if (!line.empty() && line.back() == '\r')
        {
          line.pop_back();
        }
        if (firstLine)
        {
          parseRequestLine(line, request);
          firstLine = false;
          continue;
        }
        auto colon = line.find(':');
        if (colon != std::string::npos)
        {
          request.headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
        }
      }
      if (firstLine)
      {
        throw std::invalid_argument("Empty HTTP request");
      }
      return request;
    }

  private:
    static void parseRequestLine(const std::string &line, HttpRequest &request)
    {
      std::istringstream iss(line);
      std::string method;
      iss >> method >> request.target >> request.version;
      if (method.empty() || request.target.empty() || request.version.rfind("HTTP/", 0) != 0)
      {
        throw std::invalid_argument("Malformed request line: " + line);
      }
      request.method = parseMethod(method);

      auto q = request.target.find('?');
      request.path = request.target.substr(0, q);
      if (q != std::string::npos)
      {
        request.query = request.target.substr(q + 1);
        request.queryParams = parseQuery(request.query);
      }
    }
  };

  inline const char *statusText(int code)
  {
    switch (code)
    {
    case 100:
      return "Continue";
    case 200:
      return "OK";
    case 201:
      return "Created";
    case 202:
      return "Accepted";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 411:
      return "Length Required";
    case 413:
      return "Payload Too Large";
    case 431:
      return "Request Header Fields Too Large";
    case 500:
      return "Internal Server Error";
    case 501:
      return "Not Implemented";
    case 503:
      return "Service Unavailable";
    default:
      return "Unknown";
    }
  }

  struct HttpResponse
  {
    int status{200};
    HttpHeaders headers;
    std::string body;

    void setContent(std::string content, const std::string &contentType)
    {
      body = std::move(content);
      headers["Content-Type"] = contentType;
    }

    void setHeader(const std::string &name, const std::string &value) { headers[name] = value; }

    std::string getHeader(const std::string &name) const
    {
      auto it = headers.find(name);
      return it != headers.end() ? it->second : std::string{};
    }

    /// \brief Serialize with a Content-Length matching the body. A HEAD
    /// response keeps the length but omits the body.
    std::string toWireFormat(bool omitBody = false) const
    {
      std::ostringstream ss;
      ss << "HTTP/1.1 " << status << " " << statusText(status) << "\r\n";
      for (const auto &h : headers)
      {
        if (toLower(h.first) != "content-length")
        {
          ss << h.first << ": " << h.second << "\r\n";
        }
      }
      ss << "Content-Length: " << body.size() << "\r\n\r\n";
      if (!omitBody)
      {
        ss << body;
      }
      return ss.str();
    }
  };

} // namespace network
} // namespace ledgergate
