/* vmcore -- A single address space virtual memory manager
 *
 *    memorymanager.h - Virtual memory manager
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __VMCORE_MEMORYMANAGER_H__
#define __VMCORE_MEMORYMANAGER_H__

#include "vmcore/settings.h"
#include "vmcore/mmu.h"
#include "vmcore/pagetable.h"

#include "os/addrspace.h"
#include "os/framealloc.h"
#include "os/replacement.h"
#include "os/swapstore.h"

#include <memory>
#include <mutex>
#include <vector>

namespace VMCore {

/* Demand paged memory manager for one global address space.
 *
 * All operations are serialized by a single lock. The page table has a
 * lock of its own, so getPageTableSnapshot() does not wait for a running
 * operation. Page faults are serviced synchronously on the caller's
 * thread.
 */
class MemoryManager
{
  protected:
    std::unique_ptr<FrameAllocator> frames;
    std::unique_ptr<ReplacementPolicy> policy;

    AddressSpaceAllocator addressSpace;
    SwapStore swap;
    PageTable pageTable;
    MMU mmu;

    MemoryStatistics stats;

    mutable std::mutex lock;

    /* The methods below expect the lock to be held. */
    bool          allocatePhysicalPage(uint64_t &frame);
    bool          servicePageFault(const uint64_t vAddr);
    AccessResult  checkWritable(const uint64_t vAddr, const size_t size);

  public:
    MemoryManager(std::unique_ptr<FrameAllocator> frames,
                  std::unique_ptr<ReplacementPolicy> policy,
                  const MemoryConfig &config = MemoryConfig());
    explicit MemoryManager(const MemoryConfig &config = MemoryConfig());
    ~MemoryManager();

    /* Reserves and maps ceil(size / pageSize) zero filled pages. Returns
     * false if either the address space or the physical memory (after
     * eviction) is exhausted; nothing stays allocated in that case.
     */
    bool          allocate(const uint64_t size, const uint32_t flags, uint64_t &vAddr);
    void          deallocate(const uint64_t vAddr, const uint64_t size);

    AccessResult  read(const uint64_t vAddr, const size_t size, std::vector<uint8_t> &data);
    AccessResult  write(const uint64_t vAddr, const std::vector<uint8_t> &data);

    /* Brings a swapped out page back in. Fails on a major fault, an
     * access to a page that is neither resident nor swapped.
     */
    bool          handlePageFault(const uint64_t vAddr);

    bool          mmap(const uint64_t size, const uint32_t protection,
                       const uint32_t flags, uint64_t &vAddr);
    void          munmap(const uint64_t vAddr, const uint64_t size);

    MemoryInfo    getMemoryInfo(void) const;

    /* Shutdown hook */
    void          flush(void);

    std::vector<PageTableEntry> getPageTableSnapshot(void) const;
    uint64_t      getFreeFrameCount(void) const;

    /* Diagnostics, not synchronized with running operations. */
    const PageTable             &getPageTable(void) const;
    const SwapStore             &getSwapStore(void) const;
    const FrameAllocator        &getFrameAllocator(void) const;
    const AddressSpaceAllocator &getAddressSpace(void) const;
    const ReplacementPolicy     &getPolicy(void) const;
    TLB                         *getTLB(void);

    MemoryManager(const MemoryManager &) = delete;
    MemoryManager &operator=(const MemoryManager &) = delete;
};

} /* namespace VMCore */

#endif /* __VMCORE_MEMORYMANAGER_H__ */
