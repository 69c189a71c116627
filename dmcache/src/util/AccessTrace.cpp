// **********************************************************************
// dmcache/src/util/AccessTrace.cpp
// **********************************************************************

#include "AccessTrace.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {
// Whole token must parse; 0x prefix means hex (strtoull base 0 would take 010 as octal)
bool parse_u32(const std::string& tok, uint32_t& v) {
  if (tok.empty()) return false;
  const bool hex = tok.size() > 2 && tok[0] == '0' && (tok[1] == 'x' || tok[1] == 'X');
  const char* s = tok.c_str() + (hex ? 2 : 0);
  char* end = nullptr;
  const unsigned long long x = std::strtoull(s, &end, hex ? 16 : 10);
  if (end == s || *end != '\0' || x > 0xffffffffull) return false;
  v = (uint32_t)x;
  return true;
}
} // namespace

bool load_access_trace(const std::string& path, std::vector<Access>& out, uint32_t* bad_line_out) {
  std::ifstream f(path);
  if (!f) {
    if (bad_line_out) *bad_line_out = 0;
    return false;
  }

  std::string line;
  uint32_t lineno = 0;
  std::vector<Access> parsed;               // only commit to out if the whole file is good
  while (std::getline(f, line)) {
    ++lineno;
    const size_t hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);

    std::istringstream ls(line);
    std::string op, a, d, extra;
    if (!(ls >> op)) continue;              // blank or comment-only

    Access acc{};
    bool ok = false;
    if ((op == "R" || op == "r") && (ls >> a) && !(ls >> extra)) {
      ok = parse_u32(a, acc.addr);
    } else if ((op == "W" || op == "w") && (ls >> a >> d) && !(ls >> extra)) {
      acc.write = true;
      ok = parse_u32(a, acc.addr) && parse_u32(d, acc.data);
    }
    if (!ok) {
      if (bad_line_out) *bad_line_out = lineno;
      return false;
    }
    parsed.push_back(acc);
  }

  out.insert(out.end(), parsed.begin(), parsed.end());
  return true;
}

size_t find_out_of_range(const std::vector<Access>& work, uint32_t addr_mask, uint32_t mem_bytes) {
  for (size_t i = 0; i < work.size(); ++i)
    if ((work[i].addr & addr_mask) >= mem_bytes) return i;
  return work.size();
}
