/* vmcore -- A single address space virtual memory manager
 *
 *    settings.h - Logging switches and manager configuration
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __VMCORE_SETTINGS_H__
#define __VMCORE_SETTINGS_H__

#include "vmcore/types.h"

#include <string>

namespace VMCore {

/* Logging switches, all messages go to std::cerr. */
extern bool LogMemoryAccesses;
extern bool LogPageFaults;
extern bool LogEvictions;
extern bool LogTLBStatistics;

const static uint64_t DefaultMemorySize = 16UL * 1024 * 1024;
const static size_t   DefaultTLBEntries = 64;
const static uint64_t DefaultSwapFactor = 2;

struct MemoryConfig
{
  uint64_t memorySize = DefaultMemorySize;
  uint64_t swapSize = DefaultSwapFactor * DefaultMemorySize;
  size_t tlbEntries = DefaultTLBEntries;
  uint8_t addressSpaceBits = VMCore::addressSpaceBits;
  ReplacementKind policy = ReplacementKind::LRU;
  bool enforceSwapLimit = true;
};

/* Parses "lru"/"l" or "clock"/"c". */
bool parseReplacementKind(const std::string &name, ReplacementKind &kind);

/* Parses a byte count with an optional K, M or G suffix. */
bool parseSize(const std::string &text, uint64_t &size);

} /* namespace VMCore */

#endif /* __VMCORE_SETTINGS_H__ */
