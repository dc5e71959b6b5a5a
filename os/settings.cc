/* vmcore -- A single address space virtual memory manager
 *
 *    settings.cc - Logging switches, configuration parsing and printers
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "vmcore/settings.h"

#include <cctype>
#include <ostream>

namespace VMCore {

bool LogMemoryAccesses = false;
bool LogPageFaults = false;
bool LogEvictions = false;
bool LogTLBStatistics = false;

bool
parseReplacementKind(const std::string &name, ReplacementKind &kind)
{
  if (name == "lru" or name == "l")
    kind = ReplacementKind::LRU;
  else if (name == "clock" or name == "c")
    kind = ReplacementKind::Clock;
  else
    return false;

  return true;
}

bool
parseSize(const std::string &text, uint64_t &size)
{
  if (text.empty() or not std::isdigit(static_cast<unsigned char>(text[0])))
    return false;

  size_t pos = 0;
  uint64_t value = 0;
  while (pos < text.size() and std::isdigit(static_cast<unsigned char>(text[pos])))
    {
      const uint64_t digit = text[pos] - '0';
      if (value > (UINT64_MAX - digit) / 10)
        return false;

      value = value * 10 + digit;
      ++pos;
    }

  if (pos < text.size())
    {
      if (pos + 1 != text.size())
        return false;

      unsigned int shift = 0;
      switch (std::toupper(static_cast<unsigned char>(text[pos])))
        {
          case 'K':
            shift = 10;
            break;
          case 'M':
            shift = 20;
            break;
          case 'G':
            shift = 30;
            break;
          default:
            return false;
        }

      if (value > (UINT64_MAX >> shift))
        return false;
      value <<= shift;
    }

  size = value;
  return true;
}

std::ostream &
operator<<(std::ostream &os, const AccessResult result)
{
  switch (result)
    {
      case AccessResult::Success:
        return os << "Success";
      case AccessResult::PermissionDenied:
        return os << "PermissionDenied";
      case AccessResult::Fault:
        return os << "Fault";
    }
  return os << "AccessResult(" << static_cast<int>(result) << ")";
}

std::ostream &
operator<<(std::ostream &os, const ReplacementKind kind)
{
  switch (kind)
    {
      case ReplacementKind::LRU:
        return os << "lru";
      case ReplacementKind::Clock:
        return os << "clock";
    }
  return os << "ReplacementKind(" << static_cast<int>(kind) << ")";
}

std::ostream &
operator<<(std::ostream &os, const MemoryInfo &info)
{
  const MemoryStatistics &s = info.statistics;

  os << std::dec
     << "Memory (bytes):" << std::endl
     << "  physical total " << info.totalPhysical
     << ", free " << info.freePhysical
     << ", used " << info.usedPhysical << std::endl
     << "  virtual total " << info.totalVirtual
     << ", free " << info.freeVirtual << std::endl
     << "  swap total " << info.swapTotal
     << ", used " << info.swapUsed << std::endl
     << "  page size " << info.pageSizeBytes << std::endl
     << "Statistics:" << std::endl
     << "# allocations: " << s.allocations
     << " (" << s.bytesAllocated << " bytes, " << s.pagesAllocated << " pages)"
     << std::endl
     << "# deallocations: " << s.deallocations
     << " (" << s.bytesDeallocated << " bytes, " << s.pagesDeallocated << " pages)"
     << std::endl
     << "# allocation failures: " << s.allocationFailures << std::endl
     << "# page faults: " << s.pageFaults
     << " (major: " << s.majorPageFaults << ")" << std::endl
     << "# TLB hits: " << s.tlbHits << ", misses: " << s.tlbMisses << std::endl
     << "# evictions: " << s.evictions << std::endl
     << "# swap outs: " << s.swapOuts << ", swap ins: " << s.swapIns
     << ", discards: " << s.swapDiscards << std::endl;

  return os;
}

} /* namespace VMCore */
