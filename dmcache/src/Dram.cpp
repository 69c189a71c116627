// **********************************************************************
// dmcache/src/Dram.cpp
// **********************************************************************
/*
   +--- Dram ---
==>| MemBusOut
<==| MemBusIn
   +------------
*/
#include "Dram.hpp"
#include <algorithm>

Dram::Dram(std::string /*name*/, uint32_t size_bytes, uint32_t word_bytes, int latency, IMPL_CTOR)
  : mem_(size_bytes, 0u), word_bytes_(word_bytes), latency_(latency < 0 ? 0 : latency)
{
  assert_always(word_bytes_ == 1 || word_bytes_ == 2 || word_bytes_ == 4, "Dram: word size must be 1, 2 or 4 bytes");
}

void Dram::set_latency(int v) {
  if (v < 0) v = 0;
  latency_ = v;
  trace("dram: latency=%d\n", latency_);
}

// Little-endian; out of range reads give zero, out of range writes are dropped
uint32_t Dram::load(uint32_t addr, uint32_t bytes) const {
  if ((uint64_t)addr + bytes > mem_.size()) return 0;
  uint32_t v = 0;
  for (uint32_t i = 0; i < bytes; ++i) v |= (uint32_t)mem_[addr + i] << (8u * i);
  return v;
}

void Dram::store(uint32_t addr, uint32_t value, uint32_t bytes) {
  if ((uint64_t)addr + bytes > mem_.size()) return;
  for (uint32_t i = 0; i < bytes; ++i) mem_[addr + i] = (uint8_t)(value >> (8u * i));
}

uint32_t Dram::read32(uint32_t addr) const           { return load(addr, 4); }
void     Dram::write32(uint32_t addr, uint32_t value) { store(addr, value, 4); }
uint32_t Dram::peek_word(uint32_t addr) const         { return load(addr, word_bytes_); }

void Dram::respond() {
  resp_.read_data  = load(hold_addr_, word_bytes_);
  resp_.data_valid = true;
  hold_valid_      = false;
  trace("dram: read  addr=0x%08x data=0x%08x\n", (unsigned)hold_addr_, (unsigned)resp_.read_data);
}

void Dram::cycle(const MemBusOut& bus) {
  ++cyc_;
  resp_.data_valid = false;                      // previous pulse has been seen

  if (bus.write_enable) {                        // no backpressure: every write beat lands now
    store(bus.address, bus.write_data, word_bytes_);
    beats_.push_back(Beat{cyc_, true, bus.address, bus.write_data});
    trace("dram: write addr=0x%08x data=0x%08x\n", (unsigned)bus.address, (unsigned)bus.write_data);
  }

  if (hold_valid_) {                             // serving a read: count down, ignore read_enable
    if (cnt_ > 0) --cnt_;
    if (cnt_ == 0) respond();
  } else if (bus.read_enable) {                  // take a new read beat
    hold_addr_  = bus.address;
    hold_valid_ = true;
    cnt_        = latency_;
    beats_.push_back(Beat{cyc_, false, bus.address, 0u});
    if (cnt_ == 0) respond();
  }
}

void Dram::cancel() {
  hold_valid_ = false;
  cnt_ = 0;
  resp_ = MemBusIn{};
}

void Dram::reset() {
  cancel();
  cyc_ = 0;
  beats_.clear();
  std::fill(mem_.begin(), mem_.end(), 0u);
}
