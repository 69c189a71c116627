// **********************************************************************
// dmcache/src/dmcache_sim.cpp
// **********************************************************************
/*
Runs a workload through one CacheCtrl + Dram pair and checks every read
against a flat reference memory. Workload is a trace file (-trace_file) or a
seeded pseudo-random mix of reads and writes.
*/

#include <descore/Parameter.hpp>

#include "CacheCtrl.hpp"
#include "CachedCpuPort.hpp"
#include "Diagnostics.hpp"
#include "Dram.hpp"
#include "util/AccessTrace.hpp"

#include <cascade/Clock.hpp>
#include <cascade/SimDefs.hpp>
#include <cascade/SimGlobals.hpp>

#include <algorithm>
#include <cstdio>
#include <random>
#include <string>
#include <unordered_map>

// **************
// Parameters (CLI flags): name, default value, help text
// **************
BoolParameter(showcontexts, false, "List component instance names (contexts) and exit");
IntParameter(addr_width, 32, "Address width in bits (ADDR_WIDTH)");
IntParameter(word_bytes, 4, "Word size in bytes (1, 2 or 4)");
IntParameter(line_size, 64, "Line size in bytes (LINE_SIZE)");
IntParameter(cache_size, 4096, "Cache size in bytes (CACHE_SIZE)");
IntParameter(mem_size, 65536, "Backing memory size in bytes");
IntParameter(mem_latency, 2, "Cycles from a read beat to its data_valid");
StringParameter(trace_file, "", "Access trace file (R <addr> / W <addr> <data>); empty runs a random workload");
IntParameter(accesses, 20000, "Random workload length");
IntParameter(seed, 1, "Random workload seed");
IntParameter(write_pct, 35, "Percentage of writes in the random workload");

namespace {

std::vector<Access> random_workload(const CacheGeometry& g, uint32_t mem_bytes, uint32_t n, uint32_t seed_value, uint32_t write_percent) {
  std::mt19937 rng(seed_value);
  // Keep most traffic inside a window a few times the cache so lines get reused and evicted
  const uint32_t window = std::min<uint32_t>(mem_bytes, g.cache_size() * 4u);
  std::uniform_int_distribution<uint32_t> word_pick(0, window / g.word_bytes() - 1u);
  std::uniform_int_distribution<uint32_t> pct(0, 99);
  std::uniform_int_distribution<uint32_t> data(0, 0xffffffffu);
  std::vector<Access> w;
  w.reserve(n);
  for (uint32_t i = 0; i < n; ++i) {
    Access a{};
    a.addr  = word_pick(rng) * g.word_bytes();
    a.write = pct(rng) < write_percent;
    a.data  = a.write ? (data(rng) & g.word_mask()) : 0u;
    w.push_back(a);
  }
  return w;
}

} // namespace

int main(int argc, char* argv[]) {
  // **************
  // Step 1: Parse tracing, parameters, and dump options
  // **************
  descore::parseTraces(argc, argv);
  Parameter::parseCommandLine(argc, argv);
  Sim::parseDumps(argc, argv);

  // **************
  // Step 2: Create components
  // **************
  const CacheGeometry geom((uint32_t)addr_width, (uint32_t)word_bytes, (uint32_t)line_size, (uint32_t)cache_size);
  const std::string mem_err = mem_size < 0 ? std::string("memory size is negative") : geom.check_memory((uint32_t)mem_size);
  if (!mem_err.empty()) printf("[ERROR] mem_size=%d: %s\n", (int)mem_size, mem_err.c_str());
  assert_always(mem_err.empty(), "Invalid memory size");
  CacheCtrl l1("l1", geom);
  Dram dram("dram", (uint32_t)mem_size, geom.word_bytes(), (int)mem_latency);
  CachedCpuPort port(l1, dram);

  if (showcontexts) {
    Sim::dumpComponentNames();
    return 0;
  }

  // **************
  // Step 3: Hook clock and initialize & reset simulator
  // **************
  Clock clk;
  l1.clk << clk;
  dram.clk << clk;
  clk.generateClock();
  Sim::init();
  Sim::reset();

  printf("[CFG] addr=%u word=%uB line=%uB cache=%uB -> lines=%u words/line=%u tag/index/offset=%u/%u/%u latency=%d\n",
         geom.addr_width(), geom.word_bytes(), geom.line_size(), geom.cache_size(),
         geom.num_lines(), geom.words_per_line(), geom.tag_bits(), geom.index_bits(), geom.offset_bits(),
         dram.latency());

  // **************
  // Step 4: Build the workload
  // **************
  std::vector<Access> work;
  const std::string trace_path = std::string(trace_file);
  if (!trace_path.empty()) {
    uint32_t bad_line = 0;
    const bool ok = load_access_trace(trace_path, work, &bad_line);
    if (!ok) printf("[ERROR] %s: %s %u\n", trace_path.c_str(), bad_line ? "malformed line" : "cannot open", bad_line);
    assert_always(ok, "Trace load failed");
    const size_t far = find_out_of_range(work, geom.addr_mask(), dram.get_size());
    if (far != work.size())
      printf("[ERROR] %s: access %zu addr 0x%08x is beyond mem_size %u\n", trace_path.c_str(), far + 1,
             (unsigned)work[far].addr, (unsigned)dram.get_size());
    assert_always(far == work.size(), "Trace addresses outside memory");
  } else {
    work = random_workload(geom, (uint32_t)mem_size, (uint32_t)accesses, (uint32_t)seed, (uint32_t)write_pct);
  }

  // **************
  // Step 5: Run against the reference memory
  // **************
  std::unordered_map<uint32_t, uint32_t> ref; // word-aligned addr -> value; absent means 0
  const uint32_t align = ~(geom.word_bytes() - 1u);
  for (const Access &a : work) {
    const uint32_t key = a.addr & geom.addr_mask() & align;
    if (a.write) {
      port.write(a.addr, a.data);
      ref[key] = a.data & geom.word_mask();
    } else {
      const uint32_t got = port.read(a.addr);
      const auto it = ref.find(key);
      const uint32_t want = it == ref.end() ? 0u : it->second;
      if (got != want) printf("[MISMATCH] read 0x%08x got 0x%08x want 0x%08x\n", a.addr, got, want);
      assert_always(got == want, "Read data differs from reference memory");
    }
  }

  // **************
  // Step 6: Post-mortem
  // **************
  printf("[DONE] %zu accesses\n", work.size());
  dmcache::verify_and_report_postmortem(l1, dram, port.cycles());
  return 0;
}
