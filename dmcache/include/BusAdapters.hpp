// **********************************************************************
// dmcache/include/BusAdapters.hpp
// **********************************************************************
/*
Output registers on the two sides of CacheCtrl. The FSM says what it wants
("return this word", "write this beat") and the adapter turns that into the
signal levels of BusTypes.hpp. No state beyond the registers themselves.
*/

#pragma once
#include "BusTypes.hpp"

class CpuSideAdapter {
public:
  void begin_cycle()                 { out_.data_valid = false; } // pulses last one cycle
  void complete_read(uint32_t data)  { out_.read_data = data; out_.data_valid = true; }
  void complete_write()              { out_.data_valid = true; }
  void clear()                       { out_ = CpuBusOut{}; }
  const CpuBusOut& out() const       { return out_; }

private:
  CpuBusOut out_{};
};

class MemSideAdapter {
public:
  void idle() {
    out_.read_enable  = false;
    out_.write_enable = false;
  }
  void read_beat(uint32_t addr) {
    out_.read_enable  = true;
    out_.write_enable = false;
    out_.address      = addr;
  }
  void write_beat(uint32_t addr, uint32_t data) {
    out_.read_enable  = false;
    out_.write_enable = true;
    out_.address      = addr;
    out_.write_data   = data;
  }
  void clear()                 { out_ = MemBusOut{}; }
  const MemBusOut& out() const { return out_; }

private:
  MemBusOut out_{};
};
