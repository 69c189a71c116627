// **********************************************************************
// dmcache/src/tb_cache_ctrl.cpp
// **********************************************************************
/*
Testbench for the cache controller FSM driven through CachedCpuPort.
Each check starts from a cold cache (controller + memory power-on reset).
*/

#include "CacheCtrl.hpp"
#include "CachedCpuPort.hpp"
#include "Diagnostics.hpp"
#include "Dram.hpp"
#include "util/AccessTrace.hpp"

#include <cascade/Clock.hpp>
#include <cascade/SimDefs.hpp>
#include <cascade/SimGlobals.hpp>

#include <cstdio>
#include <initializer_list>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef DMCACHE_TRACE_DIR
#define DMCACHE_TRACE_DIR "dmcache/traces"
#endif

using State = CacheCtrl::State;

namespace {

// Outcome of one access driven to completion
struct Result {
  uint32_t data = 0;
  uint64_t cycles = 0;             // request cycle through the data_valid cycle
  std::vector<State> trail;        // state after each cycle, repeats collapsed
};

void cold(CachedCpuPort& port) {
  port.ctrl().reset();
  port.dram().reset();
  if (port.resp_valid()) port.resp_consume();
}

void note(std::vector<State>& trail, State s) {
  if (trail.empty() || trail.back() != s) trail.push_back(s);
}

Result run_access(CachedCpuPort& port, bool write, uint32_t addr, uint32_t data = 0) {
  Result r;
  if (write) port.request_write(addr, data);
  else       port.request_read(addr);
  while (!port.resp_valid()) {
    assert_always(r.cycles < 100000, "access did not complete");
    port.cycle();
    ++r.cycles;
    note(r.trail, port.ctrl().state());
  }
  r.data = port.resp_data();
  port.resp_consume();
  return r;
}

// Cycle until the controller reaches s (bounded)
void run_to_state(CachedCpuPort& port, State s) {
  for (int i = 0; i < 10000 && port.ctrl().state() != s; ++i) port.cycle();
  assert_always(port.ctrl().state() == s, "target state never reached");
}

bool same_line(const CacheLine& a, const CacheLine& b) {
  return a.tag == b.tag && a.valid == b.valid && a.dirty == b.dirty && a.words == b.words;
}

void check_quiet_outputs(const CacheCtrl& c) {
  assert_always(!c.busy() && !c.has_pending(), "controller idle with no pending request");
  assert_always(!c.cpu_out().data_valid && c.cpu_out().read_data == 0, "CPU outputs cleared");
  assert_always(!c.mem_out().read_enable && !c.mem_out().write_enable && c.mem_out().address == 0, "memory outputs cleared");
  assert_always(c.beat_count() == 0, "burst counter cleared");
}

// ========================================================================
// 4 KiB / 64 B lines / 4 B words: the three end-to-end scenarios
// ========================================================================
void test_scenarios(CachedCpuPort& p) {
  cold(p);
  Dram &mem = p.dram();
  CacheCtrl &c = p.ctrl();
  for (uint32_t i = 0; i < 16; ++i) {
    mem.write32(0x0000u + 4u * i, 0x1000u + i);
    mem.write32(0x1000u + 4u * i, 0x2000u + i);
  }

  // --- 1) cold read of 0x0: 16 fill beats, then CHECK_TAG hits ---
  Result r = run_access(p, false, 0x00000000u);
  assert_always(r.data == 0x1000u, "scenario 1: fetched word returned");
  assert_always(r.cycles == 22, "scenario 1: accept + tag + dirty + 16 beats + install + serve");
  assert_always((r.trail == std::vector<State>{State::CheckTag, State::CheckDirty, State::FetchLine,
                                               State::CheckTag, State::Idle}), "scenario 1: state path");
  assert_always(mem.beats().size() == 16, "scenario 1: 16 memory beats");
  for (uint32_t i = 0; i < 16; ++i)
    assert_always(!mem.beats()[i].write && mem.beats()[i].addr == 4u * i, "scenario 1: in-order read beats");
  assert_always(c.storage().valid(0) && !c.storage().dirty(0) && c.storage().tag(0) == 0, "scenario 1: line 0 resident, clean");

  // --- 2) write hit: dirty, no memory traffic ---
  mem.clear_beats();
  r = run_access(p, true, 0x00000000u, 0xDEADBEEFu);
  assert_always(r.cycles == 2, "scenario 2: accept + CHECK_TAG");
  assert_always((r.trail == std::vector<State>{State::CheckTag, State::Idle}), "scenario 2: state path");
  assert_always(mem.beats().empty(), "scenario 2: write hit stays in the cache");
  assert_always(c.storage().dirty(0) && c.storage().read_word(0, 0) == 0xDEADBEEFu, "scenario 2: line dirty with new word");
  assert_always(mem.read32(0x0u) == 0x1000u, "scenario 2: memory not yet updated");

  // --- 3) conflicting read of 0x1000: write-back of 16 beats, then fill ---
  mem.clear_beats();
  r = run_access(p, false, 0x00001000u);
  assert_always(r.data == 0x2000u, "scenario 3: new line's word returned");
  assert_always(r.cycles == 39, "scenario 3: 17 write-back cycles ahead of the fill");
  assert_always((r.trail == std::vector<State>{State::CheckTag, State::CheckDirty, State::WriteBack,
                                               State::FetchLine, State::CheckTag, State::Idle}), "scenario 3: state path");
  assert_always(mem.beats().size() == 32, "scenario 3: 16 writes + 16 reads");
  for (uint32_t i = 0; i < 16; ++i) {
    const Dram::Beat &w = mem.beats()[i];
    const Dram::Beat &f = mem.beats()[16 + i];
    assert_always(w.write && w.addr == 4u * i, "scenario 3: write-back beats to the old line, in order");
    assert_always(w.data == (i == 0 ? 0xDEADBEEFu : 0x1000u + i), "scenario 3: write-back carries the cached words");
    assert_always(!f.write && f.addr == 0x1000u + 4u * i, "scenario 3: fill beats from the new line");
  }
  assert_always(mem.beats()[15].cycle < mem.beats()[16].cycle, "scenario 3: write-back completes before the fetch");
  assert_always(mem.read32(0x0u) == 0xDEADBEEFu, "scenario 3: dirty word reached memory");
  assert_always(c.storage().valid(0) && !c.storage().dirty(0) && c.storage().tag(0) == 1, "scenario 3: new line clean");

  assert_always(c.read_count() == 2 && c.write_count() == 1, "scenario stats: requests");
  assert_always(c.hit_count() == 1 && c.miss_count() == 2, "scenario stats: one hit, two misses");
  assert_always(c.fill_count() == 2 && c.writeback_count() == 1, "scenario stats: fills and write-backs");
  assert_always(c.mem_read_beats() == 32 && c.mem_write_beats() == 16, "scenario stats: beats");
  dmcache::verify_and_report_postmortem(c, mem, p.cycles());
}

// ========================================================================
// Write then read returns the written word, hit or miss
// ========================================================================
void test_round_trip(CachedCpuPort& p) {
  cold(p);
  CacheCtrl &c = p.ctrl();

  // write miss: fill, then WRITE_DATA without a second tag check
  Result w = run_access(p, true, 0x00002468u, 0xCAFEF00Du);
  assert_always((w.trail == std::vector<State>{State::CheckTag, State::CheckDirty, State::FetchLine,
                                               State::WriteData, State::Idle}), "write miss: state path");
  assert_always(c.storage().dirty(c.geometry().decompose(0x2468u).index), "write miss: allocated line dirty");
  assert_always(run_access(p, false, 0x00002468u).data == 0xCAFEF00Du, "write miss then read");
  assert_always(run_access(p, false, 0x00002469u).data == 0xCAFEF00Du, "byte address inside the word reads it too");

  // write hit
  run_access(p, true, 0x00002460u, 0x01234567u);
  assert_always(run_access(p, false, 0x00002460u).data == 0x01234567u, "write hit then read");
  assert_always(run_access(p, false, 0x00002468u).data == 0xCAFEF00Du, "neighbour word untouched");

  // written value survives eviction and comes back from memory
  run_access(p, false, 0x00003468u);   // same index, evicts the dirty line
  assert_always(p.dram().read32(0x2468u) == 0xCAFEF00Du, "evicted word in memory");
  assert_always(run_access(p, false, 0x00002468u).data == 0xCAFEF00Du, "refetched after eviction");
}

// ========================================================================
// A read hit never changes storage
// ========================================================================
void test_read_hit_idempotent(CachedCpuPort& p) {
  cold(p);
  CacheCtrl &c = p.ctrl();
  run_access(p, true, 0x40u, 0x55u);   // index 1, dirty
  run_access(p, false, 0x80u);         // index 2, clean
  std::vector<CacheLine> before;
  for (uint32_t i = 0; i < c.storage().num_lines(); ++i) before.push_back(c.storage().evict_prepare(i));
  const uint64_t fills = c.fill_count();

  p.dram().clear_beats();
  assert_always(run_access(p, false, 0x40u).data == 0x55u, "dirty line hit");
  assert_always(run_access(p, false, 0x84u).data == 0u, "clean line hit");
  for (uint32_t i = 0; i < c.storage().num_lines(); ++i)
    assert_always(same_line(before[i], c.storage().evict_prepare(i)), "read hit left the line unchanged");
  assert_always(p.dram().beats().empty() && c.fill_count() == fills, "read hit made no memory traffic");
}

// ========================================================================
// Evicting a clean line never writes memory
// ========================================================================
void test_clean_eviction(CachedCpuPort& p) {
  cold(p);
  CacheCtrl &c = p.ctrl();
  run_access(p, false, 0x0u);
  p.dram().clear_beats();

  p.request_read(0x1000u);
  bool saw_write_enable = false;
  std::vector<State> trail;
  while (!p.resp_valid()) {
    p.cycle();
    saw_write_enable |= c.mem_out().write_enable;
    note(trail, c.state());
  }
  p.resp_consume();
  assert_always(!saw_write_enable, "clean eviction: mem write_enable never raised");
  assert_always((trail == std::vector<State>{State::CheckTag, State::CheckDirty, State::FetchLine,
                                             State::CheckTag, State::Idle}), "clean eviction skips WRITE_BACK");
  for (const Dram::Beat &b : p.dram().beats()) assert_always(!b.write, "clean eviction: no write beats");
  assert_always(c.writeback_count() == 0, "clean eviction: no write-back counted");
}

// ========================================================================
// Non-zero index and tag: write-back goes to the victim's own address
// ========================================================================
void test_writeback_address(CachedCpuPort& p) {
  cold(p);                                   // 4 lines x 16 B: offset 3:0, index 5:4
  CacheCtrl &c = p.ctrl();
  run_access(p, true, 0x134u, 0xA5A5u);          // tag 4, index 3, word 1
  p.dram().clear_beats();
  assert_always(run_access(p, false, 0x2B4u).data == 0u, "conflicting read (tag 10, index 3)");
  const std::vector<Dram::Beat> &b = p.dram().beats();
  assert_always(b.size() == 8, "4 write-back beats + 4 fill beats");
  for (uint32_t i = 0; i < 4; ++i) {
    assert_always(b[i].write && b[i].addr == 0x130u + 4u * i, "write-back to 0x130..0x13c");
    assert_always(!b[4 + i].write && b[4 + i].addr == 0x2B0u + 4u * i, "fill from 0x2b0..0x2bc");
  }
  assert_always(b[1].data == 0xA5A5u, "dirty word written back");
  assert_always(c.storage().tag(3) == 10 && !c.storage().dirty(3), "victim replaced");
}

// ========================================================================
// Memory latency stretches every fill beat; the FSM waits as long as it takes
// ========================================================================
void test_latency(CachedCpuPort& p) {
  cold(p);
  CacheCtrl &c = p.ctrl();
  Dram &mem = p.dram();
  const uint32_t wpl = c.geometry().words_per_line();

  for (int lat : {0, 1, 3, 7}) {
    cold(p);
    mem.set_latency(lat);
    mem.write32(0x20u, 0x77u);
    const Result r = run_access(p, false, 0x20u);
    assert_always(r.data == 0x77u, "latency: data returned");
    assert_always(r.cycles == 6u + (uint64_t)wpl * (uint64_t)(lat + 1), "latency: each beat takes latency+1 cycles");
  }

  // never-answering memory: stays in FETCH_LINE holding word 0's request
  cold(p);
  mem.set_latency(1000000);
  p.request_read(0x40u);
  for (int i = 0; i < 500; ++i) p.cycle();
  assert_always(c.state() == State::FetchLine && c.beat_count() == 0, "blocked awaiting mem data_valid");
  assert_always(c.mem_out().read_enable && c.mem_out().address == 0x40u, "read beat held on the bus");
  assert_always(!p.resp_valid(), "no completion while memory is silent");
  p.pulse_reset();
  p.cycle();
  check_quiet_outputs(c);
  assert_always(!mem.read_outstanding(), "reset line drops the outstanding read");
  mem.set_latency(3);
}

// ========================================================================
// rst from every state: IDLE next cycle, outputs cleared, then normal service
// ========================================================================
void test_reset_every_state(CachedCpuPort& p) {
  CacheCtrl &c = p.ctrl();
  const State targets[] = {State::Idle, State::CheckTag, State::CheckDirty,
                           State::WriteBack, State::FetchLine, State::WriteData};
  for (State s : targets) {
    cold(p);
    run_access(p, true, 0x0u, 0xBEEFu);          // index 0 holds a dirty line
    const bool write_req = (s == State::WriteData);
    if (write_req) p.request_write(0x2000u, 0x1234u);
    else           p.request_read(0x1000u);
    if (s != State::Idle) run_to_state(p, s);
    const uint64_t resets = c.reset_count();

    p.pulse_reset();
    p.cycle();
    assert_always(c.state() == State::Idle, "rst forces IDLE");
    assert_always(c.reset_count() == resets + 1, "rst counted");
    check_quiet_outputs(c);
    assert_always(!p.resp_valid(), "in-flight request discarded");
    p.cycle();
    assert_always(c.state() == State::Idle && !c.cpu_out().data_valid, "discarded request does not resurface");

    // storage survives rst: the dirty word is still readable whatever was interrupted
    assert_always(run_access(p, false, 0x0u).data == 0xBEEFu, "dirty data intact after rst");
    run_access(p, true, 0x1004u, 0x99u);
    assert_always(run_access(p, false, 0x1004u).data == 0x99u, "service resumes after rst");
    dmcache::verify_and_report_postmortem(c, p.dram(), p.cycles());
  }
}

// ========================================================================
// Protocol violations are dropped, counted, and do not disturb state
// ========================================================================
void test_protocol_violations(CachedCpuPort& p) {
  cold(p);
  CacheCtrl &c = p.ctrl();
  run_access(p, true, 0x0u, 0x1111u);

  // both enables in IDLE: nothing accepted
  std::vector<CacheLine> before;
  for (uint32_t i = 0; i < c.storage().num_lines(); ++i) before.push_back(c.storage().evict_prepare(i));
  CpuBusIn both{};
  both.read_enable = true;
  both.write_enable = true;
  both.address = 0x0u;
  both.write_data = 0x2222u;
  p.drive(both);
  p.cycle();
  assert_always(c.state() == State::Idle && !c.has_pending(), "both enables: request not latched");
  assert_always(c.protocol_violations() == 1, "both enables: violation counted");
  p.cycle();
  assert_always(!c.cpu_out().data_valid, "both enables: no completion");
  for (uint32_t i = 0; i < c.storage().num_lines(); ++i)
    assert_always(same_line(before[i], c.storage().evict_prepare(i)), "both enables: storage untouched");

  // new request while busy: ignored, the original completes untouched
  p.request_read(0x1000u);                   // conflict miss with write-back
  p.cycle();
  p.cycle();
  assert_always(c.busy(), "miss in progress");
  CpuBusIn intruder{};
  intruder.write_enable = true;
  intruder.address = 0x1000u;
  intruder.write_data = 0xBADu;
  p.drive(intruder);
  p.cycle();
  assert_always(c.protocol_violations() == 2, "request while busy counted");
  while (!p.resp_valid()) p.cycle();
  assert_always(p.resp_data() == 0u, "original read answered with memory data");
  p.resp_consume();
  assert_always(c.write_count() == 1 && c.read_count() == 1, "intruding write never accepted");
  assert_always(run_access(p, false, 0x1000u).data == 0u, "intruding write never applied");
  assert_always(run_access(p, false, 0x0u).data == 0x1111u, "evicted data preserved");
}

// ========================================================================
// Unreachable state encoding: counted, forced back to IDLE
// ========================================================================
void test_state_fault(CachedCpuPort& p) {
  cold(p);
  CacheCtrl &c = p.ctrl();
  const State bogus = static_cast<State>(0x7);
  assert_always(std::string(CacheCtrl::state_name(bogus)) == "INVALID", "bogus encoding has no name");

  c.force_state(bogus);
  p.cycle();
  assert_always(c.state() == State::Idle && c.state_faults() == 1, "fault in IDLE recovered");

  // mid-fill fault with a slow memory: the abandoned read must not feed the next fill
  Dram &mem = p.dram();
  mem.set_latency(10);
  for (uint32_t i = 0; i < 4; ++i) {
    mem.write32(0x40u + 4u * i, 0xa040u + 4u * i);
    mem.write32(0x80u + 4u * i, 0xa080u + 4u * i);
  }
  p.request_read(0x40u);
  run_to_state(p, State::FetchLine);
  p.cycle();
  assert_always(mem.read_outstanding(), "first fill beat outstanding");
  c.force_state(static_cast<State>(0xff));
  p.cycle();
  assert_always(c.state_faults() == 2, "mid-fill fault counted");
  assert_always(!c.busy() && !c.has_pending() && !c.mem_out().read_enable, "mid-fill fault resynchronised");
  assert_always(!c.storage().valid(c.geometry().decompose(0x40u).index), "interrupted fill never installed");
  assert_always(!mem.read_outstanding(), "fault resync cancels the outstanding memory read");
  assert_always(p.can_request() && !p.resp_valid(), "port free again without a reset pulse");

  // same index, different tag; no rst in between
  const uint64_t resets = c.reset_count();
  assert_always(run_access(p, false, 0x84u).data == 0xa084u, "service after fault recovery");
  assert_always(c.reset_count() == resets, "recovered without the rst line");
  const uint32_t idx = c.geometry().decompose(0x80u).index;
  assert_always(c.storage().valid(idx) && !c.storage().dirty(idx), "refilled line installed clean");
  for (uint32_t i = 0; i < 4; ++i)
    assert_always(c.storage().read_word(idx, i) == mem.read32(0x80u + 4u * i), "refilled line matches memory");
  dmcache::verify_and_report_postmortem(c, mem, p.cycles());
  mem.set_latency(3);
}

// ========================================================================
// data_valid is a one-cycle pulse
// ========================================================================
void test_data_valid_pulse(CachedCpuPort& p) {
  cold(p);
  CacheCtrl &c = p.ctrl();
  p.dram().write32(0x8u, 0x8888u);
  run_access(p, false, 0x8u);
  assert_always(c.cpu_out().data_valid && c.cpu_out().read_data == 0x8888u, "pulse high on completion cycle");
  p.cycle();
  assert_always(!c.cpu_out().data_valid, "pulse gone one cycle later");
  run_access(p, true, 0x8u, 1u);
  assert_always(c.cpu_out().data_valid, "write completion pulses too");
  p.cycle();
  assert_always(!c.cpu_out().data_valid, "write pulse gone one cycle later");
}

// ========================================================================
// Narrow words: values are masked to the word width on the way in and out
// ========================================================================
void test_half_words(CachedCpuPort& p) {
  cold(p);
  run_access(p, true, 0x0102u, 0xABCDEFu);
  assert_always(run_access(p, false, 0x0102u).data == 0xCDEFu, "16-bit word keeps its low half");
  run_access(p, true, 0x0104u, 0x1u);
  assert_always(run_access(p, false, 0x0103u).data == 0xCDEFu, "odd byte address selects the same half-word");
  run_access(p, false, 0x8102u);                  // 16-bit addresses, 256 B cache: same index, evict
  assert_always(p.dram().peek_word(0x0102u) == 0xCDEFu && p.dram().peek_word(0x0104u) == 0x1u, "half-words written back");
  assert_always(run_access(p, false, 0x10102u).data == 0xCDEFu, "address bits above ADDR_WIDTH ignored");
}

// ========================================================================
// Trace files
// ========================================================================
void test_trace_file(CachedCpuPort& p) {
  const std::string dir = DMCACHE_TRACE_DIR;
  std::vector<Access> work;
  uint32_t bad = 99;
  assert_always(load_access_trace(dir + "/scenarios.trc", work, &bad), "scenarios.trc loads");
  assert_always(work.size() == 6, "six accesses in scenarios.trc");
  assert_always(!work[0].write && work[0].addr == 0x0u, "R 0x00000000");
  assert_always(work[1].write && work[1].addr == 0x0u && work[1].data == 0xDEADBEEFu, "W 0x00000000 0xDEADBEEF");
  assert_always(work[4].write && work[4].addr == 0x103Cu && work[4].data == 7u, "decimal data");

  std::vector<Access> none;
  assert_always(!load_access_trace(dir + "/malformed.trc", none, &bad) && bad == 2, "malformed line reported");
  assert_always(none.empty(), "nothing committed from a malformed trace");
  assert_always(!load_access_trace(dir + "/does_not_exist.trc", none, &bad) && bad == 0, "missing file reported");

  // addresses past the end of memory are caught before anything runs
  assert_always(find_out_of_range(work, 0xffffffffu, 0x10000u) == work.size(), "scenarios.trc fits 64 KiB");
  std::vector<Access> high;
  assert_always(load_access_trace(dir + "/out_of_range.trc", high, &bad) && high.size() == 3, "out_of_range.trc loads");
  assert_always(find_out_of_range(high, 0xffffffffu, 4096u) == 2, "first access past 4 KiB found");
  assert_always(find_out_of_range(high, 0xffffffffu, 8192u) == high.size(), "fits a larger memory");
  const std::vector<Access> wrapped = {Access{false, 0x10102u, 0u}};
  assert_always(find_out_of_range(wrapped, 0xffffu, 0x10000u) == 1, "bits above the address width are dropped first");
  assert_always(find_out_of_range(wrapped, 0xffffffffu, 0x10000u) == 0, "full-width address out of range");

  cold(p);
  std::unordered_map<uint32_t, uint32_t> ref;
  for (const Access &a : work) {
    if (a.write) {
      p.write(a.addr, a.data);
      ref[a.addr & ~3u] = a.data;
    } else {
      const auto it = ref.find(a.addr & ~3u);
      assert_always(p.read(a.addr) == (it == ref.end() ? 0u : it->second), "trace read matches reference");
    }
  }
  assert_always(p.ctrl().writeback_count() == 1, "trace: one dirty eviction");
}

// ========================================================================
// Random mix on a tiny cache against a flat reference memory
// ========================================================================
void test_random_against_reference(CachedCpuPort& p, uint32_t n, uint32_t seed) {
  cold(p);
  const CacheGeometry &g = p.ctrl().geometry();
  std::mt19937 rng(seed);
  std::uniform_int_distribution<uint32_t> word(0, (g.cache_size() * 8u) / g.word_bytes() - 1u);
  std::uniform_int_distribution<uint32_t> coin(0, 2);
  std::uniform_int_distribution<uint32_t> val;
  std::unordered_map<uint32_t, uint32_t> ref;
  for (uint32_t i = 0; i < n; ++i) {
    const uint32_t addr = word(rng) * g.word_bytes();
    if (coin(rng) == 0) {
      const uint32_t v = val(rng) & g.word_mask();
      p.write(addr, v);
      ref[addr] = v;
    } else {
      const auto it = ref.find(addr);
      assert_always(p.read(addr) == (it == ref.end() ? 0u : it->second), "random read matches reference");
    }
  }
  assert_always(p.ctrl().protocol_violations() == 0 && p.ctrl().state_faults() == 0, "clean run");
  dmcache::verify_and_report_postmortem(p.ctrl(), p.dram(), p.cycles());
}

} // namespace

int main(int argc, char* argv[]) {
  descore::parseTraces(argc, argv);

  // **************
  // Create components: three cache/memory pairs of different shapes
  // **************
  CacheCtrl l1_4k("l1_4k", CacheGeometry(32, 4, 64, 4096));   // 64 lines x 16 words
  Dram      mem_4k("mem_4k", 64 * 1024, 4, 0);
  CacheCtrl l1_small("l1_small", CacheGeometry(32, 4, 16, 64)); // 4 lines x 4 words
  Dram      mem_small("mem_small", 4 * 1024, 4, 3);
  CacheCtrl l1_half("l1_half", CacheGeometry(16, 2, 16, 256)); // 16 lines x 8 half-words
  Dram      mem_half("mem_half", 64 * 1024, 2, 1);

  CachedCpuPort p4k(l1_4k, mem_4k);
  CachedCpuPort psmall(l1_small, mem_small);
  CachedCpuPort phalf(l1_half, mem_half);

  Clock clk;
  l1_4k.clk << clk;
  mem_4k.clk << clk;
  l1_small.clk << clk;
  mem_small.clk << clk;
  l1_half.clk << clk;
  mem_half.clk << clk;
  clk.generateClock();
  Sim::init();
  Sim::reset();

  test_scenarios(p4k);
  test_round_trip(p4k);
  test_read_hit_idempotent(p4k);
  test_clean_eviction(p4k);
  test_trace_file(p4k);
  test_writeback_address(psmall);
  test_latency(psmall);
  test_reset_every_state(psmall);
  test_protocol_violations(psmall);
  test_state_fault(psmall);
  test_data_valid_pulse(psmall);
  test_half_words(phalf);
  test_random_against_reference(psmall, 5000, 7);
  test_random_against_reference(phalf, 5000, 11);

  printf("tb_cache_ctrl: PASS\n");
  return 0;
}
