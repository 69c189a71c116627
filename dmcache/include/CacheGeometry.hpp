// **********************************************************************
// dmcache/include/CacheGeometry.hpp
// **********************************************************************
/*
Fixed sizes of a direct-mapped cache and the address split they imply.

  | <------------------ ADDR_WIDTH ------------------> |
  |      tag       |     index      |      offset      |
  |   TAG_BITS     |   INDEX_BITS   |   OFFSET_BITS    |
                                    | word | byte-in-w |
*/

#pragma once
#include <cstdint>
#include <string>

struct AddrFields {
  uint32_t tag    = 0;
  uint32_t index  = 0; // which line
  uint32_t offset = 0; // byte within line
  uint32_t word   = 0; // offset / word_bytes
};

class CacheGeometry {
public:
  // Fatal (assert_always) on an invalid combination, see check().
  CacheGeometry(uint32_t addr_width, uint32_t word_bytes, uint32_t line_size, uint32_t cache_size);

  // Returns an empty string for a legal configuration, otherwise the first problem found.
  static std::string check(uint32_t addr_width, uint32_t word_bytes, uint32_t line_size, uint32_t cache_size);
  // Same contract for the backing memory behind this cache.
  std::string check_memory(uint32_t mem_bytes) const;

  uint32_t addr_width()     const { return addr_width_; }
  uint32_t word_bytes()     const { return word_bytes_; }
  uint32_t line_size()      const { return line_size_; }
  uint32_t cache_size()     const { return cache_size_; }
  uint32_t num_lines()      const { return num_lines_; }
  uint32_t words_per_line() const { return words_per_line_; }
  uint32_t offset_bits()    const { return offset_bits_; }
  uint32_t index_bits()     const { return index_bits_; }
  uint32_t tag_bits()       const { return tag_bits_; }
  uint32_t word_sel_bits()  const { return word_sel_bits_; }
  uint32_t addr_mask()      const { return addr_mask_; }
  uint32_t word_mask()      const { return word_mask_; }

  // Pure and total: bits above ADDR_WIDTH are dropped, nothing is range checked.
  AddrFields decompose(uint32_t addr) const;
  // Byte address of word 0 of the line holding (tag, index)
  uint32_t line_address(uint32_t tag, uint32_t index) const;
  uint32_t word_address(uint32_t line_base, uint32_t word) const { return (line_base + word * word_bytes_) & addr_mask_; }

private:
  uint32_t addr_width_;
  uint32_t word_bytes_;
  uint32_t line_size_;
  uint32_t cache_size_;
  // derived
  uint32_t num_lines_      = 0;
  uint32_t words_per_line_ = 0;
  uint32_t offset_bits_    = 0;
  uint32_t index_bits_     = 0;
  uint32_t tag_bits_       = 0;
  uint32_t word_sel_bits_  = 0;
  uint32_t addr_mask_      = 0;
  uint32_t word_mask_      = 0;
};

namespace dmcache {
inline bool is_pow2(uint32_t v) { return v != 0 && (v & (v - 1)) == 0; }
inline uint32_t log2u(uint32_t v) { // v must be a power of two
  uint32_t n = 0;
  while (v > 1) { v >>= 1; ++n; }
  return n;
}
} // namespace dmcache
