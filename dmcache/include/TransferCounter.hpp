// **********************************************************************
// dmcache/include/TransferCounter.hpp
// **********************************************************************
/*
Beat counter for a line burst (write-back or fill). Counts accepted beats
0..limit and sticks at limit; done() is the only exit test the FSM uses.
*/

#pragma once
#include <cstdint>

class TransferCounter {
public:
  explicit TransferCounter(uint32_t limit) : limit_(limit) {}

  void     reset()         { count_ = 0; }
  void     advance()       { if (count_ < limit_) ++count_; } // saturates, never wraps
  bool     done()    const { return count_ == limit_; }
  uint32_t value()   const { return count_; }
  uint32_t limit()   const { return limit_; }

private:
  uint32_t limit_;     // WORDS_PER_LINE
  uint32_t count_ = 0;
};
