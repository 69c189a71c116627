// **********************************************************************
// dmcache/include/Dram.hpp
// **********************************************************************
/*
Lower-level memory behind the cache: answers the controller's word-at-a-time
beats. Writes are taken the cycle they are presented; a read is held
(1-entry) and answered with a one-cycle data_valid pulse after latency cycles.

   +--- Dram ---
==>| MemBusOut (from CacheCtrl)
<==| MemBusIn  (to CacheCtrl)
   +------------
*/

#pragma once
#include <cascade/Cascade.hpp>
#include <cstdint>
#include <vector>
#include "BusTypes.hpp"

class Dram : public Component {
  DECLARE_COMPONENT(Dram);
public:
  Dram(std::string name, uint32_t size_bytes, uint32_t word_bytes, int latency, COMPONENT_CTOR);
  Clock(clk);

  void cycle(const MemBusOut& bus);               // observe this clock's request signals
  const MemBusIn& response() const { return resp_; }
  void set_latency(int v);   // applies to the next accepted read (in-flight unaffected)
  int  latency() const { return latency_; }
  void cancel();             // drop an outstanding read (shared reset line)
  bool read_outstanding() const { return hold_valid_; }
  void reset();

  // host/test helpers, no timing
  uint32_t get_size() const { return (uint32_t)mem_.size(); }
  uint32_t read32(uint32_t addr) const;
  void     write32(uint32_t addr, uint32_t value);
  uint32_t peek_word(uint32_t addr) const;        // word_bytes wide, little-endian

  // every beat the controller drove, in order
  struct Beat { uint64_t cycle; bool write; uint32_t addr; uint32_t data; };
  const std::vector<Beat>& beats() const { return beats_; }
  void clear_beats() { beats_.clear(); }

private:
  std::vector<uint8_t> mem_;
  uint32_t word_bytes_;
  int      latency_ = 0;
  uint64_t cyc_ = 0;

  // Read hold (1-entry)
  bool     hold_valid_ = false;
  uint32_t hold_addr_  = 0;
  int      cnt_        = 0;
  MemBusIn resp_{};

  std::vector<Beat> beats_;

  uint32_t load(uint32_t addr, uint32_t bytes) const;
  void     store(uint32_t addr, uint32_t value, uint32_t bytes);
  void     respond();
};
