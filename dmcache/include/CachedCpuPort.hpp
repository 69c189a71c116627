// **********************************************************************
// dmcache/include/CachedCpuPort.hpp
// **********************************************************************
/*
Wires one CacheCtrl to one Dram and exposes the pair as a CpuPort.
Per cycle():
  1. sample Dram's response (registered last cycle)
  2. tick CacheCtrl with rst, the CPU enables and that response
  3. let Dram see CacheCtrl's new memory-side outputs
A request drives read_enable/write_enable for exactly the next cycle.
*/

#pragma once

#include "CacheCtrl.hpp"
#include "CpuPort.hpp"
#include "Dram.hpp"

class CachedCpuPort : public CpuPort {
public:
  CachedCpuPort(CacheCtrl& ctrl, Dram& dram, uint64_t timeout_cycles = 100000);

  uint32_t read(uint32_t addr) override;
  void     write(uint32_t addr, uint32_t value) override;

  void     cycle() override;
  bool     can_request() const override;
  void     request_read(uint32_t addr) override;
  void     request_write(uint32_t addr, uint32_t value) override;
  bool     resp_valid() const override { return resp_valid_; }
  uint32_t resp_data() const override  { return resp_data_; }
  void     resp_consume() override     { resp_valid_ = false; }

  // Raw drive for protocol checks: these enables go out on the next cycle as-is
  void     drive(const CpuBusIn& in) { drive_ = in; drive_pending_ = true; }
  // Assert the shared reset line for the next cycle (controller and memory)
  void     pulse_reset() { rst_ = true; }
  void     set_timeout(uint64_t cycles) { timeout_ = cycles; }

  uint64_t cycles() const { return cycles_; }
  CacheCtrl& ctrl() { return ctrl_; }
  Dram&      dram() { return dram_; }

private:
  CacheCtrl& ctrl_;
  Dram&      dram_;
  uint64_t   timeout_;
  uint64_t   cycles_ = 0;

  bool     rst_ = false;
  bool     drive_pending_ = false;
  CpuBusIn drive_{};

  bool     in_flight_ = false;
  bool     resp_valid_ = false;
  uint32_t resp_data_ = 0;

  void wait_response();
};
