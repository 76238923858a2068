#include "sql_queries.hpp"

#include <array>

namespace assetdb::db::sql {

namespace {

constexpr std::array<const char*, 7> kTables = {
    "genesis_points", "genesis_assets", "internal_keys", "script_keys", "asset_groups", "asset_group_sigs", "assets",
};

} // namespace

bool IsKnownTable(const std::string& table) {
  for (const char* known : kTables) {
    if (table == known) return true;
  }
  return false;
}

std::string Numbered(const char* sql) {
  std::string out;
  int         n        = 0;
  bool        in_quote = false;
  for (const char* p = sql; *p != '\0'; ++p) {
    if (*p == '\'') in_quote = !in_quote;
    if (*p == '?' && !in_quote) {
      out += '$';
      out += std::to_string(++n);
      continue;
    }
    out += *p;
  }
  return out;
}

} // namespace assetdb::db::sql
