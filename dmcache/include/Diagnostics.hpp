// **********************************************************************
// dmcache/include/Diagnostics.hpp
// **********************************************************************
/*
End-of-run checks of cache contents against memory, plus the stats line.
*/
#pragma once
#include <cstdint>
#include "CacheCtrl.hpp"
#include "Dram.hpp"

namespace dmcache {

// Asserts: dirty lines are valid, valid clean lines match memory word for word.
// Returns the number of dirty lines (memory is stale there).
uint32_t verify_and_report_postmortem(const CacheCtrl& ctrl, const Dram& dram, uint64_t cycles);

void print_stats(const CacheCtrl& ctrl);

} // namespace dmcache
