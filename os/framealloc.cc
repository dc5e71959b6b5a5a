/* vmcore -- A single address space virtual memory manager
 *
 *    framealloc.cc - Physical frame allocator
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "framealloc.h"

#include <iostream>
#include <stdexcept>
#include <algorithm>
#include <string>

#include <errno.h>
#include <string.h>
#include <sys/mman.h>  /* mmap() */

namespace VMCore {

FrameAllocator::FrameAllocator(const uint64_t memorySize)
  : baseAddress(nullptr), memorySize(memorySize),
    nFrames(memorySize / pageSize), nAllocatedFrames(0), maxAllocatedFrames(0),
    freeList(), allocated()
{
  if (memorySize == 0 or memorySize % pageSize != 0)
    throw std::runtime_error("physical memory size must be a non-zero multiple of the page size.");

  /* Circuit breaker: avoid too large memory allocations to avoid the user
   * of this program getting into trouble. We limit at 2 GiB.
   */
  if (memorySize > 2ULL * 1024 * 1024 * 1024)
    throw std::runtime_error("automatic protection: attempted to allocate more than 2 GiB of memory.");

  /* Try to allocate "physical" memory. */
  baseAddress = mmap(nullptr, memorySize,
                     PROT_READ | PROT_WRITE,
                     MAP_ANONYMOUS | MAP_PRIVATE, -1, 0);
  if (baseAddress == MAP_FAILED)
    throw std::runtime_error("mmap for physical memory failed: "
                             + std::string(strerror(errno)));

  allocated.assign(nFrames, false);
  for (uint64_t frame = 0; frame < nFrames; ++frame)
    freeList.push_back(frame);

  std::cerr << "BOOT: system memory @ "
            << std::hex << std::showbase << baseAddress
            << " page size of " << pageSize << " bytes, "
            << std::dec
            << nFrames << " frames available." << std::endl;
}

FrameAllocator::~FrameAllocator()
{
  munmap(baseAddress, memorySize);
}

bool
FrameAllocator::allocate(uint64_t &frame)
{
  if (freeList.empty())
    return false;

  frame = freeList.front();
  freeList.pop_front();
  allocated[frame] = true;

  nAllocatedFrames++;
  maxAllocatedFrames = std::max(maxAllocatedFrames, nAllocatedFrames);

  return true;
}

void
FrameAllocator::free(const uint64_t frame)
{
  if (frame >= nFrames)
    throw std::runtime_error("FrameAllocator: frame " + std::to_string(frame)
                             + " is outside the physical pool.");
  if (not allocated[frame])
    throw std::runtime_error("FrameAllocator: frame " + std::to_string(frame)
                             + " freed twice.");

  allocated[frame] = false;
  freeList.push_back(frame);
  nAllocatedFrames--;
}

uint8_t *
FrameAllocator::getFrameData(const uint64_t frame) const
{
  if (frame >= nFrames)
    throw std::out_of_range("FrameAllocator: no such frame " + std::to_string(frame));

  return static_cast<uint8_t *>(baseAddress) + frame * pageSize;
}

uint8_t *
FrameAllocator::getPhysicalData(const uint64_t pAddr) const
{
  return getFrameData(pAddr >> pageBits) + (pAddr & (pageSize - 1));
}

uint64_t
FrameAllocator::getFrameCount(void) const
{
  return nFrames;
}

uint64_t
FrameAllocator::getFreeFrameCount(void) const
{
  return freeList.size();
}

uint64_t
FrameAllocator::getMemorySize(void) const
{
  return memorySize;
}

bool
FrameAllocator::isAllocated(const uint64_t frame) const
{
  return frame < nFrames and allocated[frame];
}

bool
FrameAllocator::allReleased(void) const
{
  return nAllocatedFrames == 0;
}

uint64_t
FrameAllocator::getMaxAllocatedFrames(void) const
{
  return maxAllocatedFrames;
}

} /* namespace VMCore */
