// **********************************************************************
// dmcache/src/CacheCtrl.cpp
// **********************************************************************
/*
Per-clock behaviour of the cache controller. Each tick:
  0. drop last cycle's completion pulse
  1. rst -> back to IDLE, nothing else happens
  2. flag (and drop) any request that shows up while not IDLE
  3. run the handler of the current state
Memory beats are one word each; a line burst is WORDS_PER_LINE beats.
*/
#include "CacheCtrl.hpp"
#include <algorithm>

CacheCtrl::CacheCtrl(std::string /*name*/, const CacheGeometry& geom, IMPL_CTOR)
  : geom_(geom),
    storage_(geom_),
    counter_(geom_.words_per_line()),
    fill_buf_(geom_.words_per_line(), 0u) {}

const char* CacheCtrl::state_name(State s) {
  switch (s) {
    case State::Idle:       return "IDLE";
    case State::CheckTag:   return "CHECK_TAG";
    case State::CheckDirty: return "CHECK_DIRTY";
    case State::WriteBack:  return "WRITE_BACK";
    case State::FetchLine:  return "FETCH_LINE";
    case State::WriteData:  return "WRITE_DATA";
    default:                return "INVALID";
  }
}

void CacheCtrl::tick(bool rst, const CpuBusIn& cpu, const MemBusIn& mem) {
  ++cycle_count_;
  cpu_side_.begin_cycle();

  if (rst) {
    ++reset_count_;
    trace("rst in %s\n", state_name(state_));
    sync_reset();
    return;
  }

  // Non-pipelined: a request is only taken in IDLE, anything else is dropped
  if (state_ != State::Idle && (cpu.read_enable || cpu.write_enable)) {
    ++protocol_violations_;
    trace("ignored %s addr=0x%08x while %s\n", cpu.write_enable ? "write" : "read",
          (unsigned)cpu.address, state_name(state_));
  }

  switch (state_) {
    case State::Idle:       on_idle(cpu);       break;
    case State::CheckTag:   on_check_tag();     break;
    case State::CheckDirty: on_check_dirty();   break;
    case State::WriteBack:  on_write_back();    break;
    case State::FetchLine:  on_fetch_line(mem); break;
    case State::WriteData:  on_write_data();    break;
    default:                                     // unreachable encoding: resync
      ++state_faults_;
      trace("state fault (encoding %u), forcing IDLE\n", (unsigned)state_);
      sync_reset();
      break;
  }
}

// ----- IDLE: latch a request -----
void CacheCtrl::on_idle(const CpuBusIn& cpu) {
  if (!cpu.read_enable && !cpu.write_enable) return;
  if (cpu.read_enable && cpu.write_enable) {     // no defined precedence, so take neither
    ++protocol_violations_;
    trace("ignored request with both enables addr=0x%08x\n", (unsigned)cpu.address);
    return;
  }
  pending_          = PendingRequest{};
  pending_.valid    = true;
  pending_.is_write = cpu.write_enable;
  pending_.address  = cpu.address & geom_.addr_mask();
  pending_.wdata    = cpu.write_data & geom_.word_mask();
  pending_.f        = geom_.decompose(pending_.address);
  if (pending_.is_write) ++write_count_; else ++read_count_;
  trace("accept %s addr=0x%08x tag=0x%x index=%u word=%u\n", pending_.is_write ? "write" : "read",
        (unsigned)pending_.address, (unsigned)pending_.f.tag, (unsigned)pending_.f.index, (unsigned)pending_.f.word);
  state_ = State::CheckTag;
}

// ----- CHECK_TAG: serve a hit, or start the miss sequence -----
void CacheCtrl::on_check_tag() {
  const AddrFields &f = pending_.f;
  if (dmcache::is_hit(storage_, f.index, f.tag)) {
    if (!pending_.filled) ++hit_count_;          // the post-fill lookup is not a second hit
    if (pending_.is_write) {
      storage_.write_word(f.index, f.word, pending_.wdata);
      storage_.mark_dirty(f.index);
      cpu_side_.complete_write();
    } else {
      cpu_side_.complete_read(storage_.read_word(f.index, f.word));
    }
    trace("%s addr=0x%08x done\n", pending_.filled ? "fill-hit" : "hit", (unsigned)pending_.address);
    pending_ = PendingRequest{};
    state_ = State::Idle;
    return;
  }
  assert_always(!pending_.filled, "CacheCtrl: line just installed does not hit");
  ++miss_count_;
  trace("miss addr=0x%08x index=%u\n", (unsigned)pending_.address, (unsigned)f.index);
  counter_.reset();
  state_ = State::CheckDirty;
}

// ----- CHECK_DIRTY: write back the occupant only if it is valid and dirty -----
void CacheCtrl::on_check_dirty() {
  const uint32_t idx = pending_.f.index;
  fill_base_ = geom_.line_address(pending_.f.tag, idx);
  if (storage_.valid(idx) && storage_.dirty(idx)) {
    victim_      = storage_.evict_prepare(idx);
    victim_base_ = geom_.line_address(victim_.tag, idx);
    trace("evict dirty line index=%u base=0x%08x\n", (unsigned)idx, (unsigned)victim_base_);
    state_ = State::WriteBack;
  } else {
    state_ = State::FetchLine;
  }
}

// ----- WRITE_BACK: one word per beat, memory takes every beat -----
void CacheCtrl::on_write_back() {
  if (counter_.done()) {
    mem_side_.idle();
    storage_.clear_dirty(pending_.f.index);
    counter_.reset();
    ++writeback_count_;
    state_ = State::FetchLine;
    return;
  }
  const uint32_t i = counter_.value();
  mem_side_.write_beat(geom_.word_address(victim_base_, i), victim_.words[i]);
  ++mem_write_beats_;
  counter_.advance();
}

// ----- FETCH_LINE: hold a read beat until memory answers, then ask for the next word -----
void CacheCtrl::on_fetch_line(const MemBusIn& mem) {
  if (counter_.done()) {
    storage_.install_line(pending_.f.index, pending_.f.tag, fill_buf_);
    ++fill_count_;
    pending_.filled = true;
    trace("fill index=%u base=0x%08x\n", (unsigned)pending_.f.index, (unsigned)fill_base_);
    state_ = pending_.is_write ? State::WriteData : State::CheckTag;
    return;
  }
  if (mem.data_valid && mem_side_.out().read_enable) {
    fill_buf_[counter_.value()] = mem.read_data & geom_.word_mask();
    ++mem_read_beats_;
    counter_.advance();
  }
  if (counter_.done()) mem_side_.idle();
  else                 mem_side_.read_beat(geom_.word_address(fill_base_, counter_.value()));
}

// ----- WRITE_DATA: apply the pending write to the freshly filled line -----
void CacheCtrl::on_write_data() {
  const AddrFields &f = pending_.f;
  storage_.write_word(f.index, f.word, pending_.wdata);
  storage_.mark_dirty(f.index);
  cpu_side_.complete_write();
  trace("write-allocate addr=0x%08x done\n", (unsigned)pending_.address);
  pending_ = PendingRequest{};
  state_ = State::Idle;
}

void CacheCtrl::sync_reset() {
  state_       = State::Idle;
  pending_     = PendingRequest{};
  counter_.reset();
  cpu_side_.clear();
  mem_side_.clear();
  victim_      = CacheLine{};
  victim_base_ = 0;
  fill_base_   = 0;
}

// clear state
void CacheCtrl::reset() {
  sync_reset();
  storage_.invalidate_all();
  std::fill(fill_buf_.begin(), fill_buf_.end(), 0u);
  cycle_count_         = 0;
  read_count_          = 0;
  write_count_         = 0;
  hit_count_           = 0;
  miss_count_          = 0;
  writeback_count_     = 0;
  fill_count_          = 0;
  mem_read_beats_      = 0;
  mem_write_beats_     = 0;
  protocol_violations_ = 0;
  state_faults_        = 0;
  reset_count_         = 0;
}
