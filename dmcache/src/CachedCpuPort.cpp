// **********************************************************************
// dmcache/src/CachedCpuPort.cpp
// **********************************************************************
// Single-outstanding CpuPort in front of a CacheCtrl/Dram pair.

#include "CachedCpuPort.hpp"

CachedCpuPort::CachedCpuPort(CacheCtrl& ctrl, Dram& dram, uint64_t timeout_cycles)
  : ctrl_(ctrl), dram_(dram), timeout_(timeout_cycles) {}

void CachedCpuPort::cycle() {
  const MemBusIn mem_in = dram_.response();
  CpuBusIn cpu_in{};
  if (drive_pending_) {                // enables are high for this one cycle only
    cpu_in = drive_;
    drive_pending_ = false;
  }
  const bool rst = rst_;
  rst_ = false;
  const uint64_t faults = ctrl_.state_faults();

  ctrl_.tick(rst, cpu_in, mem_in);
  // memory shares the reset line; a state fault resync drives it too
  if (rst || ctrl_.state_faults() != faults) {
    dram_.cancel();
    in_flight_ = false;
    resp_valid_ = false;
  } else {
    dram_.cycle(ctrl_.mem_out());
  }
  ++cycles_;

  if (in_flight_ && ctrl_.cpu_out().data_valid) {
    resp_data_  = ctrl_.cpu_out().read_data;
    resp_valid_ = true;
    in_flight_  = false;
  }
}

bool CachedCpuPort::can_request() const {
  return !in_flight_ && !resp_valid_ && !drive_pending_ && !ctrl_.busy();
}

void CachedCpuPort::request_read(uint32_t addr) {
  assert_always(can_request(), "CachedCpuPort read request issued while busy");
  drive_ = CpuBusIn{};
  drive_.read_enable = true;
  drive_.address = addr;
  drive_pending_ = true;
  in_flight_ = true;
}

void CachedCpuPort::request_write(uint32_t addr, uint32_t value) {
  assert_always(can_request(), "CachedCpuPort write request issued while busy");
  drive_ = CpuBusIn{};
  drive_.write_enable = true;
  drive_.address = addr;
  drive_.write_data = value;
  drive_pending_ = true;
  in_flight_ = true;
}

void CachedCpuPort::wait_response() {
  const uint64_t start = cycles_;
  while (!resp_valid_) {
    assert_always(cycles_ - start < timeout_, "CachedCpuPort: access did not complete within the cycle budget");
    cycle();
  }
}

uint32_t CachedCpuPort::read(uint32_t addr) {
  request_read(addr);
  wait_response();
  resp_consume();
  return resp_data_;
}

void CachedCpuPort::write(uint32_t addr, uint32_t value) {
  request_write(addr, value);
  wait_response();
  resp_consume();
}
