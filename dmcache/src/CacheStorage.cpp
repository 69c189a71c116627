// **********************************************************************
// dmcache/src/CacheStorage.cpp
// **********************************************************************

#include "CacheStorage.hpp"
#include <cascade/Cascade.hpp>
#include <algorithm>

CacheStorage::CacheStorage(const CacheGeometry& geom)
  : meta_(geom.num_lines()),
    words_((size_t)geom.num_lines() * geom.words_per_line(), 0u),
    wpl_(geom.words_per_line()),
    word_mask_(geom.word_mask()) {}

size_t CacheStorage::slot(uint32_t index, uint32_t word_idx) const {
  assert_always(index < meta_.size(), "CacheStorage: line index out of range");
  assert_always(word_idx < wpl_,      "CacheStorage: word index out of range");
  return (size_t)index * wpl_ + word_idx;
}

uint32_t CacheStorage::read_word(uint32_t index, uint32_t word_idx) const {
  return words_[slot(index, word_idx)];
}

void CacheStorage::write_word(uint32_t index, uint32_t word_idx, uint32_t value) {
  words_[slot(index, word_idx)] = value & word_mask_;
}

CacheLine CacheStorage::evict_prepare(uint32_t index) const {
  const size_t base = slot(index, 0);
  CacheLine l;
  l.tag   = meta_[index].tag;
  l.valid = meta_[index].valid;
  l.dirty = meta_[index].dirty;
  l.words.assign(words_.begin() + (long)base, words_.begin() + (long)(base + wpl_));
  return l;
}

void CacheStorage::install_line(uint32_t index, uint32_t tag, const std::vector<uint32_t>& words) {
  assert_always(words.size() == wpl_, "CacheStorage: install_line needs a full line");
  const size_t base = slot(index, 0);
  for (uint32_t i = 0; i < wpl_; ++i) words_[base + i] = words[i] & word_mask_;
  meta_[index].tag   = tag;
  meta_[index].valid = true;
  meta_[index].dirty = false;
}

void CacheStorage::mark_dirty(uint32_t index) {
  assert_always(index < meta_.size(), "CacheStorage: line index out of range");
  assert_always(meta_[index].valid,   "CacheStorage: only a valid line can become dirty");
  meta_[index].dirty = true;
}

void CacheStorage::clear_dirty(uint32_t index) {
  assert_always(index < meta_.size(), "CacheStorage: line index out of range");
  meta_[index].dirty = false;
}

void CacheStorage::invalidate_all() {
  for (auto &m : meta_) m = Meta{};
  std::fill(words_.begin(), words_.end(), 0u);
}
