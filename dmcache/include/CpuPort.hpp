// **********************************************************************
// dmcache/include/CpuPort.hpp
// **********************************************************************
/*
Software-side view of the single in-order requester. Not a simulatable
object, just the protocol a driver (testbench, workload runner) talks:
issue one request, cycle until resp_valid(), consume, repeat.
*/
#pragma once
#include <cstdint>

class CpuPort {
public:
  virtual          ~CpuPort()                              = default;
  virtual uint32_t read(uint32_t addr)                     = 0; // blocking
  virtual void     write(uint32_t addr, uint32_t value)    = 0; // blocking
  virtual void     cycle()                                 = 0; // advance one clock
  virtual bool     can_request() const                     = 0; // no request outstanding, no unconsumed response
  virtual void     request_read(uint32_t addr)             = 0;
  virtual void     request_write(uint32_t addr, uint32_t value) = 0;
  virtual bool     resp_valid() const                      = 0;
  virtual uint32_t resp_data() const                       = 0;
  virtual void     resp_consume()                          = 0;
};
