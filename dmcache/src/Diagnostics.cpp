// **********************************************************************
// dmcache/src/Diagnostics.cpp
// **********************************************************************
#include "Diagnostics.hpp"
#include <cstdio>
#include <iostream>

namespace dmcache {

uint32_t verify_and_report_postmortem(const CacheCtrl& ctrl, const Dram& dram, uint64_t cycles) {
  const CacheGeometry &g = ctrl.geometry();
  const CacheStorage  &s = ctrl.storage();

  // === 1) Line invariants ===
  uint32_t valid = 0, dirty = 0;
  for (uint32_t idx = 0; idx < s.num_lines(); ++idx) {
    if (s.dirty(idx)) assert_always(s.valid(idx), "dirty line must be valid");
    if (!s.valid(idx)) continue;
    ++valid;
    if (s.dirty(idx)) { ++dirty; continue; }
    // === 2) Clean lines mirror memory ===
    const uint32_t base = g.line_address(s.tag(idx), idx);
    for (uint32_t w = 0; w < g.words_per_line(); ++w) {
      const uint32_t addr = g.word_address(base, w);
      if (s.read_word(idx, w) != dram.peek_word(addr)) {
        std::cout << "clean line " << idx << " word " << w << " @0x" << std::hex << addr
                  << " cache=0x" << s.read_word(idx, w) << " mem=0x" << dram.peek_word(addr)
                  << std::dec << std::endl;
      }
      assert_always(s.read_word(idx, w) == dram.peek_word(addr), "clean line differs from memory");
    }
  }

  // === 3) Controller is quiescent ===
  assert_always(!ctrl.busy() && !ctrl.has_pending(), "controller still has a request in flight");

  // === 4) Summary ===
  std::cout << "Cycle count: " << cycles
            << " lines valid=" << valid << "/" << s.num_lines()
            << " dirty=" << dirty << std::endl;
  print_stats(ctrl);
  return dirty;
}

void print_stats(const CacheCtrl& ctrl) {
  const uint64_t lookups = ctrl.hit_count() + ctrl.miss_count();
  const double   rate    = lookups ? 100.0 * (double)ctrl.hit_count() / (double)lookups : 0.0;
  printf("[STATS] reads=%llu writes=%llu hits=%llu misses=%llu (hit %.1f%%) writebacks=%llu fills=%llu "
         "mem_rd_beats=%llu mem_wr_beats=%llu violations=%llu faults=%llu resets=%llu\n",
         (unsigned long long)ctrl.read_count(),
         (unsigned long long)ctrl.write_count(),
         (unsigned long long)ctrl.hit_count(),
         (unsigned long long)ctrl.miss_count(),
         rate,
         (unsigned long long)ctrl.writeback_count(),
         (unsigned long long)ctrl.fill_count(),
         (unsigned long long)ctrl.mem_read_beats(),
         (unsigned long long)ctrl.mem_write_beats(),
         (unsigned long long)ctrl.protocol_violations(),
         (unsigned long long)ctrl.state_faults(),
         (unsigned long long)ctrl.reset_count());
}

} // namespace dmcache
