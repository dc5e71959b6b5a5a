/* vmcore -- A single address space virtual memory manager
 *
 *    framealloc.h - Physical frame allocator
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __VMCORE_FRAMEALLOC_H__
#define __VMCORE_FRAMEALLOC_H__

#include "vmcore/settings.h"

#include <deque>
#include <vector>

namespace VMCore {

/* Fixed pool of physical frames backed by an anonymous mapping. Frames are
 * handed out from a FIFO free list; the allocator never evicts, running
 * out of frames is reported to the caller.
 */
class FrameAllocator
{
  protected:
    void *baseAddress;
    const uint64_t memorySize;

    uint64_t nFrames;
    uint64_t nAllocatedFrames;
    uint64_t maxAllocatedFrames;

    std::deque<uint64_t> freeList;
    std::vector<bool> allocated;

  public:
    explicit FrameAllocator(const uint64_t memorySize);
    ~FrameAllocator();

    bool      allocate(uint64_t &frame);
    void      free(const uint64_t frame);

    uint8_t  *getFrameData(const uint64_t frame) const;
    uint8_t  *getPhysicalData(const uint64_t pAddr) const;

    uint64_t  getFrameCount(void) const;
    uint64_t  getFreeFrameCount(void) const;
    uint64_t  getMemorySize(void) const;

    bool      isAllocated(const uint64_t frame) const;
    bool      allReleased(void) const;
    uint64_t  getMaxAllocatedFrames(void) const;

    FrameAllocator(const FrameAllocator &) = delete;
    FrameAllocator &operator=(const FrameAllocator &) = delete;
};

} /* namespace VMCore */

#endif /* __VMCORE_FRAMEALLOC_H__ */
