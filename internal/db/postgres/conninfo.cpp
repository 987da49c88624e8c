#include "conninfo.hpp"

#include <cctype>
#include <iterator>

#include "internal/util/errors.hpp"

namespace upgrader::db::postgres {

namespace {

const char* SslModeKeyword(core::SslMode mode) {
  return mode == core::SslMode::kRequire ? "require" : "disable";
}

bool IsUri(const std::string& s) {
  return s.rfind("postgresql://", 0) == 0 || s.rfind("postgres://", 0) == 0;
}

// libpq sslmode keywords ordered by strength; -1 when unknown.
int SslModeStrength(const std::string& mode) {
  static const char* const kModes[] = {"disable", "allow", "prefer", "require", "verify-ca", "verify-full"};
  for (int i = 0; i < static_cast<int>(std::size(kModes)); ++i) {
    if (mode == kModes[i]) return i;
  }
  return -1;
}

std::optional<std::string> UriSslMode(const std::string& uri) {
  auto query = uri.find('?');
  if (query == std::string::npos) return std::nullopt;
  auto end = uri.find('#', query);
  if (end == std::string::npos) end = uri.size();

  std::optional<std::string> found;
  std::size_t pos = query + 1;
  while (pos < end) {
    auto amp = uri.find('&', pos);
    if (amp == std::string::npos || amp > end) amp = end;
    const auto param = uri.substr(pos, amp - pos);
    const auto eq    = param.find('=');
    if (eq != std::string::npos && param.substr(0, eq) == "sslmode") {
      found = param.substr(eq + 1);
    }
    pos = amp + 1;
  }
  return found;
}

std::optional<std::string> KeyValueSslMode(const std::string& cs) {
  std::optional<std::string> found;
  std::size_t pos = 0;
  auto skip_space = [&]() {
    while (pos < cs.size() && std::isspace(static_cast<unsigned char>(cs[pos]))) ++pos;
  };

  while (true) {
    skip_space();
    if (pos >= cs.size()) break;

    std::string key;
    while (pos < cs.size() && cs[pos] != '=' && !std::isspace(static_cast<unsigned char>(cs[pos]))) key.push_back(cs[pos++]);
    skip_space();
    if (pos >= cs.size() || cs[pos] != '=') {
      throw util::ConfigurationError("malformed connection string near \"" + key + "\"");
    }
    ++pos;
    skip_space();

    std::string value;
    if (pos < cs.size() && cs[pos] == '\'') {
      ++pos;
      while (pos < cs.size() && cs[pos] != '\'') {
        if (cs[pos] == '\\' && pos + 1 < cs.size()) ++pos;
        value.push_back(cs[pos++]);
      }
      if (pos >= cs.size()) throw util::ConfigurationError("unterminated quoted value in connection string");
      ++pos;
    } else {
      while (pos < cs.size() && !std::isspace(static_cast<unsigned char>(cs[pos]))) {
        if (cs[pos] == '\\' && pos + 1 < cs.size()) ++pos;
        value.push_back(cs[pos++]);
      }
    }

    if (key == "sslmode") found = value;
  }
  return found;
}

// A connection string that already names an sslmode is kept as written,
// provided it is at least as strict as the requested mode.
void CheckExistingSslMode(const std::string& existing, core::SslMode ssl_mode) {
  const int strength = SslModeStrength(existing);
  if (strength < 0) {
    throw util::ConfigurationError("unknown sslmode in connection string: " + existing);
  }
  if (ssl_mode == core::SslMode::kDisable && strength != SslModeStrength("disable")) {
    throw util::ConfigurationError("connection string sets sslmode=" + existing + " but TLS is disabled");
  }
  if (ssl_mode == core::SslMode::kRequire && strength < SslModeStrength("require")) {
    throw util::ConfigurationError("connection string sets sslmode=" + existing + " but TLS is required");
  }
}

} // namespace

std::string QuoteConnValue(const std::string& value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('\'');
  for (char c : value) {
    if (c == '\\' || c == '\'') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string BuildConnInfo(const ConnectionTarget& target, core::SslMode ssl_mode) {
  const std::string sslmode = SslModeKeyword(ssl_mode);

  if (target.connection_string && !target.connection_string->empty()) {
    const auto& cs       = *target.connection_string;
    const bool   uri      = IsUri(cs);
    const auto   existing = uri ? UriSslMode(cs) : KeyValueSslMode(cs);
    if (existing) {
      CheckExistingSslMode(*existing, ssl_mode);
      return cs;
    }
    if (uri) {
      return cs + (cs.find('?') == std::string::npos ? "?" : "&") + "sslmode=" + sslmode;
    }
    return cs + " sslmode=" + sslmode;
  }

  if (target.host.empty()) throw util::ConfigurationError("host required");
  if (target.user.empty()) throw util::ConfigurationError("user required");
  if (target.dbname.empty()) throw util::ConfigurationError("database required");

  return "host=" + QuoteConnValue(target.host) + " port=" + std::to_string(target.port) + " user=" + QuoteConnValue(target.user) +
         " password=" + QuoteConnValue(target.password) + " dbname=" + QuoteConnValue(target.dbname) + " sslmode=" + sslmode;
}

} // namespace upgrader::db::postgres
