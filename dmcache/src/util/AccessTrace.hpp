// **********************************************************************
// dmcache/src/util/AccessTrace.hpp
// **********************************************************************

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct Access {
  bool     write = false;
  uint32_t addr  = 0;
  uint32_t data  = 0; // writes only
};

/*
Load a text access trace, one access per line:
    R <addr>
    W <addr> <data>
Numbers are hex with 0x or decimal. '#' starts a comment; blank lines are skipped.
- Returns true on success (accesses appended to out).
- On failure returns false; bad_line_out (if given) gets the 1-based line, 0 if the file could not be opened.
*/
bool load_access_trace(const std::string& path, std::vector<Access>& out, uint32_t* bad_line_out = nullptr);

// Index of the first access whose address (after addr_mask) lies at or beyond mem_bytes; work.size() if none.
size_t find_out_of_range(const std::vector<Access>& work, uint32_t addr_mask, uint32_t mem_bytes);
