// **********************************************************************
// dmcache/include/CacheCtrl.hpp
// **********************************************************************
/*
Direct-mapped, write-back, write-allocate cache controller. One request in
flight at a time; the harness calls tick() once per clock with the sampled
inputs and reads the registered outputs afterwards.

  IDLE -> CHECK_TAG -hit-------------------------------------------> IDLE
                    -miss-> CHECK_DIRTY -dirty-> WRITE_BACK -+
                                        -clean---------------+-> FETCH_LINE
  FETCH_LINE -read-> CHECK_TAG (hits)     FETCH_LINE -write-> WRITE_DATA -> IDLE
*/
#pragma once

#include <cascade/Cascade.hpp>
#include <cstdint>
#include <vector>
#include "BusAdapters.hpp"
#include "BusTypes.hpp"
#include "CacheGeometry.hpp"
#include "CacheStorage.hpp"
#include "TransferCounter.hpp"

class CacheCtrl : public Component {
  DECLARE_COMPONENT(CacheCtrl);

public:
  CacheCtrl(std::string name, const CacheGeometry& geom, COMPONENT_CTOR);
  Clock(clk);

  enum class State : uint8_t {
    Idle       = 0,
    CheckTag   = 1,
    CheckDirty = 2,
    WriteBack  = 3,
    FetchLine  = 4,
    WriteData  = 5,
  };
  static const char* state_name(State s);

  // One clock edge. rst wins over everything else.
  void tick(bool rst, const CpuBusIn& cpu, const MemBusIn& mem);
  void reset();  // power-on: FSM idle and every line invalid

  // Registered outputs
  const CpuBusOut& cpu_out() const { return cpu_side_.out(); }
  const MemBusOut& mem_out() const { return mem_side_.out(); }

  // Status helpers
  State    state()           const { return state_; }
  bool     busy()            const { return state_ != State::Idle; }
  bool     has_pending()     const { return pending_.valid; }
  uint32_t beat_count()      const { return counter_.value(); }
  const CacheGeometry& geometry() const { return geom_; }
  const CacheStorage&  storage()  const { return storage_; }

  // Simple micro-architectural counters
  uint64_t cycle_count()         const { return cycle_count_; }
  uint64_t read_count()          const { return read_count_; }
  uint64_t write_count()         const { return write_count_; }
  uint64_t hit_count()           const { return hit_count_; }
  uint64_t miss_count()          const { return miss_count_; }
  uint64_t writeback_count()     const { return writeback_count_; }
  uint64_t fill_count()          const { return fill_count_; }
  uint64_t mem_read_beats()      const { return mem_read_beats_; }
  uint64_t mem_write_beats()     const { return mem_write_beats_; }
  uint64_t protocol_violations() const { return protocol_violations_; }
  uint64_t state_faults()        const { return state_faults_; }
  uint64_t reset_count()         const { return reset_count_; }

  // Verification hook: load an arbitrary encoding into the state register
  void force_state(State s) { state_ = s; }

private:
  // The one outstanding request
  struct PendingRequest {
    bool       valid    = false;
    bool       is_write = false;
    uint32_t   address  = 0;
    uint32_t   wdata    = 0;
    AddrFields f{};
    bool       filled   = false; // line was fetched for this request
  };

  void on_idle(const CpuBusIn& cpu);
  void on_check_tag();
  void on_check_dirty();
  void on_write_back();
  void on_fetch_line(const MemBusIn& mem);
  void on_write_data();
  void sync_reset();   // rst line / fault recovery: FSM, pending, counter, outputs

  CacheGeometry  geom_;
  CacheStorage   storage_;
  TransferCounter counter_;
  CpuSideAdapter cpu_side_;
  MemSideAdapter mem_side_;

  State          state_ = State::Idle;
  PendingRequest pending_{};

  // Burst state
  std::vector<uint32_t> fill_buf_;    // words arriving during FETCH_LINE
  uint32_t              fill_base_ = 0;
  CacheLine             victim_{};    // snapshot taken in CHECK_DIRTY
  uint32_t              victim_base_ = 0;

  uint64_t cycle_count_         = 0;
  uint64_t read_count_          = 0;
  uint64_t write_count_         = 0;
  uint64_t hit_count_           = 0;
  uint64_t miss_count_          = 0;
  uint64_t writeback_count_     = 0;
  uint64_t fill_count_          = 0;
  uint64_t mem_read_beats_      = 0;
  uint64_t mem_write_beats_     = 0;
  uint64_t protocol_violations_ = 0;
  uint64_t state_faults_        = 0;
  uint64_t reset_count_         = 0;
};
