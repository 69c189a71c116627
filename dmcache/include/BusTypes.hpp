// **********************************************************************
// dmcache/include/BusTypes.hpp
// **********************************************************************
/*
Signal bundles on the two sides of the cache controller, sampled once per clock.

   CpuBusIn  -->+-- CacheCtrl --+--> MemBusOut
   CpuBusOut <--+               +<-- MemBusIn
*/

#pragma once
#include <cstdint>

// Requester -> controller (level-triggered, sampled on the clock edge)
struct CpuBusIn {
  bool     read_enable  = false;
  bool     write_enable = false;
  uint32_t address      = 0;   // byte address, ADDR_WIDTH bits used
  uint32_t write_data   = 0;   // one word
};

// Controller -> requester (registered)
struct CpuBusOut {
  uint32_t read_data  = 0;     // only meaningful while data_valid is high
  bool     data_valid = false; // one-cycle pulse: read data ready or write done
};

// Controller -> memory (registered, one word per beat)
struct MemBusOut {
  bool     read_enable  = false;
  bool     write_enable = false;
  uint32_t address      = 0;
  uint32_t write_data   = 0;
};

// Memory -> controller
struct MemBusIn {
  uint32_t read_data  = 0;
  bool     data_valid = false; // one-cycle pulse per read beat served
};
