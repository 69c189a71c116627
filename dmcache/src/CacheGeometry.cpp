// **********************************************************************
// dmcache/src/CacheGeometry.cpp
// **********************************************************************

#include "CacheGeometry.hpp"
#include <cascade/Cascade.hpp>
#include <iostream>

using dmcache::is_pow2;
using dmcache::log2u;

std::string CacheGeometry::check(uint32_t addr_width, uint32_t word_bytes, uint32_t line_size, uint32_t cache_size) {
  if (addr_width == 0 || addr_width > 32)   return "address width must be 1..32 bits";
  if (word_bytes != 1 && word_bytes != 2 && word_bytes != 4)
                                            return "word size must be 1, 2 or 4 bytes";
  if (!is_pow2(line_size))                  return "line size must be a power of two";
  if (!is_pow2(cache_size))                 return "cache size must be a power of two";
  if (line_size < word_bytes)               return "line size must hold at least one word";
  if (cache_size < line_size)               return "cache size must hold at least one line";
  const uint32_t used = log2u(cache_size / line_size) + log2u(line_size); // index + offset
  if (used > addr_width)                    return "index and offset do not fit in the address";
  return std::string();
}

std::string CacheGeometry::check_memory(uint32_t mem_bytes) const {
  if (mem_bytes < line_size_)               return "memory must hold at least one line";
  if (mem_bytes % line_size_ != 0)          return "memory size must be a whole number of lines";
  if (addr_width_ < 32 && mem_bytes > (1ull << addr_width_))
                                            return "memory is larger than the address space";
  return std::string();
}

CacheGeometry::CacheGeometry(uint32_t addr_width, uint32_t word_bytes, uint32_t line_size, uint32_t cache_size)
  : addr_width_(addr_width), word_bytes_(word_bytes), line_size_(line_size), cache_size_(cache_size)
{
  const std::string err = check(addr_width, word_bytes, line_size, cache_size);
  if (!err.empty())
    std::cerr << "CacheGeometry(addr=" << addr_width << " word=" << word_bytes
              << " line=" << line_size << " cache=" << cache_size << "): " << err << std::endl;
  assert_always(err.empty(), "Invalid cache geometry");

  num_lines_      = cache_size_ / line_size_;
  words_per_line_ = line_size_ / word_bytes_;
  offset_bits_    = log2u(line_size_);
  index_bits_     = log2u(num_lines_);
  tag_bits_       = addr_width_ - index_bits_ - offset_bits_;
  word_sel_bits_  = log2u(words_per_line_);
  addr_mask_      = (uint32_t)((1ull << addr_width_) - 1ull);
  word_mask_      = (uint32_t)((1ull << (8u * word_bytes_)) - 1ull);
}

AddrFields CacheGeometry::decompose(uint32_t addr) const {
  const uint64_t a = addr & addr_mask_;
  AddrFields f;
  f.offset = (uint32_t)(a & (line_size_ - 1u));
  f.index  = (uint32_t)((a >> offset_bits_) & (num_lines_ - 1u));
  f.tag    = (uint32_t)(a >> (offset_bits_ + index_bits_)); // 64-bit shift: tag_bits_ may be 0
  f.word   = f.offset / word_bytes_;
  return f;
}

uint32_t CacheGeometry::line_address(uint32_t tag, uint32_t index) const {
  const uint64_t a = ((uint64_t)tag << (offset_bits_ + index_bits_))
                   | ((uint64_t)(index & (num_lines_ - 1u)) << offset_bits_);
  return (uint32_t)(a & addr_mask_);
}
