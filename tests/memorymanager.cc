/* vmcore -- A single address space virtual memory manager
 *
 *    tests/memorymanager.cc - unit tests for the virtual memory manager.
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#define BOOST_TEST_MODULE MemoryManager
#include <boost/test/unit_test.hpp>

#include "os/memorymanager.h"
using namespace VMCore;

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>


static std::vector<uint8_t>
bytes(const std::string &text)
{
  return std::vector<uint8_t>(text.begin(), text.end());
}

static MemoryConfig
smallConfig(uint64_t nFrames, uint64_t nSwapPages,
            ReplacementKind policy = ReplacementKind::LRU)
{
  MemoryConfig config;
  config.memorySize = nFrames * pageSize;
  config.swapSize = nSwapPages * pageSize;
  config.tlbEntries = 4;
  config.policy = policy;
  return config;
}

BOOST_AUTO_TEST_SUITE(memorymanager_test)

/*
 * Allocation and access with plenty of memory
 */

struct ManagerFixture
{
  MemoryManager memory;

  ManagerFixture()
    : memory()
  { }
};

BOOST_FIXTURE_TEST_CASE( initial_state, ManagerFixture )
{
  MemoryInfo info = memory.getMemoryInfo();
  BOOST_CHECK_EQUAL( info.totalPhysical, DefaultMemorySize );
  BOOST_CHECK_EQUAL( info.freePhysical, DefaultMemorySize );
  BOOST_CHECK_EQUAL( info.usedPhysical, 0 );
  BOOST_CHECK_EQUAL( info.totalVirtual, 1UL << 48 );
  BOOST_CHECK_EQUAL( info.freeVirtual, (1UL << 48) - pageSize );
  BOOST_CHECK_EQUAL( info.swapTotal, DefaultSwapFactor * DefaultMemorySize );
  BOOST_CHECK_EQUAL( info.swapUsed, 0 );
  BOOST_CHECK_EQUAL( info.pageSizeBytes, 4096 );

  BOOST_CHECK( memory.getPageTableSnapshot().empty() );
  BOOST_CHECK_EQUAL( memory.getFreeFrameCount(), DefaultMemorySize / pageSize );
}

BOOST_FIXTURE_TEST_CASE( allocate_two_pages, ManagerFixture )
{
  const uint64_t freeBefore = memory.getFreeFrameCount();

  uint64_t vAddr = 0;
  BOOST_CHECK( memory.allocate(8192, AllocReadable | AllocWritable, vAddr) );
  BOOST_CHECK( vAddr != 0 );
  BOOST_CHECK_EQUAL( pageOffset(vAddr), 0 );

  auto entries = memory.getPageTableSnapshot();
  BOOST_REQUIRE_EQUAL( entries.size(), 2 );
  BOOST_CHECK_EQUAL( entries[0].virtualPage, pageNumber(vAddr) );
  BOOST_CHECK_EQUAL( entries[1].virtualPage, pageNumber(vAddr) + 1 );
  BOOST_CHECK( entries[0].isWritable() );
  BOOST_CHECK( entries[0].physicalFrame != entries[1].physicalFrame );
  BOOST_CHECK_EQUAL( memory.getFreeFrameCount(), freeBefore - 2 );

  MemoryInfo info = memory.getMemoryInfo();
  BOOST_CHECK_EQUAL( info.usedPhysical, 8192 );
  BOOST_CHECK_EQUAL( info.freeVirtual, info.totalVirtual - pageSize - 8192 );
  BOOST_CHECK_EQUAL( info.statistics.allocations, 1 );
  BOOST_CHECK_EQUAL( info.statistics.bytesAllocated, 8192 );
  BOOST_CHECK_EQUAL( info.statistics.pagesAllocated, 2 );
}

BOOST_FIXTURE_TEST_CASE( partial_page_rounds_up, ManagerFixture )
{
  uint64_t a, b;
  BOOST_CHECK( memory.allocate(1, AllocWritable, a) );
  BOOST_CHECK( memory.allocate(pageSize + 1, AllocWritable, b) );

  BOOST_CHECK_EQUAL( memory.getPageTableSnapshot().size(), 3 );
  BOOST_CHECK_EQUAL( b, a + pageSize );
}

BOOST_FIXTURE_TEST_CASE( zero_size_allocation, ManagerFixture )
{
  uint64_t vAddr = 0;
  BOOST_CHECK( memory.allocate(0, AllocWritable, vAddr) == false );
  BOOST_CHECK_EQUAL( memory.getMemoryInfo().statistics.allocationFailures, 1 );
  BOOST_CHECK( memory.getPageTableSnapshot().empty() );
}

BOOST_FIXTURE_TEST_CASE( write_then_read, ManagerFixture )
{
  uint64_t vAddr;
  BOOST_REQUIRE( memory.allocate(4096, AllocReadable | AllocWritable, vAddr) );

  BOOST_CHECK( memory.write(vAddr, bytes("hi")) == AccessResult::Success );

  std::vector<uint8_t> data;
  BOOST_CHECK( memory.read(vAddr, 2, data) == AccessResult::Success );
  BOOST_CHECK( data == bytes("hi") );

  // The write went through the TLB miss path, the read hit
  MemoryInfo info = memory.getMemoryInfo();
  BOOST_CHECK_EQUAL( info.statistics.tlbMisses, 1 );
  BOOST_CHECK_EQUAL( info.statistics.tlbHits, 1 );

  auto entries = memory.getPageTableSnapshot();
  BOOST_REQUIRE_EQUAL( entries.size(), 1 );
  BOOST_CHECK( entries[0].accessed );
  BOOST_CHECK( entries[0].dirty );
}

BOOST_AUTO_TEST_CASE( memory_is_zero_filled )
{
  MemoryManager memory(smallConfig(1, 4));

  uint64_t vAddr;
  BOOST_REQUIRE( memory.allocate(4096, AllocWritable, vAddr) );
  BOOST_CHECK( memory.write(vAddr, std::vector<uint8_t>(4096, 0xFF)) == AccessResult::Success );
  memory.deallocate(vAddr, 4096);

  // The only frame is handed out again, cleared
  uint64_t again;
  BOOST_REQUIRE( memory.allocate(4096, AllocWritable, again) );

  std::vector<uint8_t> data;
  BOOST_CHECK( memory.read(again, 4096, data) == AccessResult::Success );
  BOOST_CHECK( data == std::vector<uint8_t>(4096, 0) );
}

BOOST_FIXTURE_TEST_CASE( access_spanning_pages, ManagerFixture )
{
  uint64_t vAddr;
  BOOST_REQUIRE( memory.allocate(2 * pageSize, AllocReadable | AllocWritable, vAddr) );

  const uint64_t addr = vAddr + pageSize - 3;
  BOOST_CHECK( memory.write(addr, bytes("boundary")) == AccessResult::Success );

  std::vector<uint8_t> data;
  BOOST_CHECK( memory.read(addr, 8, data) == AccessResult::Success );
  BOOST_CHECK( data == bytes("boundary") );

  // Both pages were touched by the write
  for (const auto &entry : memory.getPageTableSnapshot())
    BOOST_CHECK( entry.dirty );
}

BOOST_FIXTURE_TEST_CASE( unmapped_access_faults, ManagerFixture )
{
  std::vector<uint8_t> data;
  BOOST_CHECK( memory.read(0x10000, 4, data) == AccessResult::Fault );
  BOOST_CHECK( memory.write(0x10000, bytes("x")) == AccessResult::Fault );

  // The guard page is never mapped
  BOOST_CHECK( memory.read(0, 1, data) == AccessResult::Fault );

  uint64_t vAddr;
  BOOST_REQUIRE( memory.allocate(4096, AllocWritable, vAddr) );
  BOOST_CHECK( memory.read(vAddr + 4090, 10, data) == AccessResult::Fault );
}

BOOST_FIXTURE_TEST_CASE( write_protection, ManagerFixture )
{
  uint64_t vAddr;
  BOOST_REQUIRE( memory.allocate(4096, AllocReadable, vAddr) );

  BOOST_CHECK( memory.write(vAddr, bytes("no")) == AccessResult::PermissionDenied );

  std::vector<uint8_t> data;
  BOOST_CHECK( memory.read(vAddr, 2, data) == AccessResult::Success );
  BOOST_CHECK( data == std::vector<uint8_t>(2, 0) );

  auto entries = memory.getPageTableSnapshot();
  BOOST_REQUIRE_EQUAL( entries.size(), 1 );
  BOOST_CHECK( not entries[0].dirty );
}

BOOST_FIXTURE_TEST_CASE( write_protection_across_pages, ManagerFixture )
{
  uint64_t rw, ro;
  BOOST_REQUIRE( memory.allocate(4096, AllocReadable | AllocWritable, rw) );
  BOOST_REQUIRE( memory.allocate(4096, AllocReadable, ro) );
  BOOST_REQUIRE_EQUAL( ro, rw + pageSize );

  // The second page is read-only, so nothing may be written
  BOOST_CHECK( memory.write(rw + pageSize - 2, bytes("abcd")) == AccessResult::PermissionDenied );

  std::vector<uint8_t> data;
  BOOST_CHECK( memory.read(rw + pageSize - 2, 2, data) == AccessResult::Success );
  BOOST_CHECK( data == std::vector<uint8_t>(2, 0) );
}

BOOST_FIXTURE_TEST_CASE( deallocate_releases_everything, ManagerFixture )
{
  const uint64_t freeBefore = memory.getFreeFrameCount();

  uint64_t vAddr;
  BOOST_REQUIRE( memory.allocate(8192, AllocReadable | AllocWritable, vAddr) );

  std::vector<uint8_t> data;
  BOOST_CHECK( memory.read(vAddr, 1, data) == AccessResult::Success );
  BOOST_CHECK( memory.read(vAddr + pageSize, 1, data) == AccessResult::Success );
  BOOST_CHECK( memory.getTLB()->contains(pageNumber(vAddr)) );
  BOOST_CHECK( memory.getTLB()->contains(pageNumber(vAddr) + 1) );

  memory.deallocate(vAddr, 8192);

  BOOST_CHECK( memory.getPageTableSnapshot().empty() );
  BOOST_CHECK_EQUAL( memory.getFreeFrameCount(), freeBefore );
  BOOST_CHECK( not memory.getTLB()->contains(pageNumber(vAddr)) );
  BOOST_CHECK( not memory.getTLB()->contains(pageNumber(vAddr) + 1) );
  BOOST_CHECK( memory.read(vAddr, 1, data) == AccessResult::Fault );

  MemoryInfo info = memory.getMemoryInfo();
  BOOST_CHECK_EQUAL( info.freeVirtual, info.totalVirtual - pageSize );
  BOOST_CHECK_EQUAL( info.statistics.deallocations, 1 );
  BOOST_CHECK_EQUAL( info.statistics.pagesDeallocated, 2 );

  // The region is handed out again
  uint64_t again;
  BOOST_CHECK( memory.allocate(4096, AllocWritable, again) );
  BOOST_CHECK_EQUAL( again, vAddr );
}

BOOST_AUTO_TEST_CASE( short_deallocate_releases_whole_region )
{
  MemoryManager memory(smallConfig(8, 8));

  uint64_t a;
  BOOST_REQUIRE( memory.allocate(2 * pageSize, AllocReadable | AllocWritable, a) );
  BOOST_CHECK( memory.write(a + pageSize, bytes("old")) == AccessResult::Success );

  // Only the first page is named, the region goes as a whole
  memory.deallocate(a, pageSize);
  BOOST_CHECK( memory.getPageTableSnapshot().empty() );
  BOOST_CHECK_EQUAL( memory.getFreeFrameCount(), 8 );
  BOOST_CHECK( not memory.getTLB()->contains(pageNumber(a) + 1) );
  BOOST_CHECK_EQUAL( memory.getMemoryInfo().statistics.pagesDeallocated, 2 );

  uint64_t b;
  BOOST_REQUIRE( memory.allocate(2 * pageSize, AllocReadable | AllocWritable, b) );
  BOOST_CHECK_EQUAL( b, a );

  std::vector<uint8_t> data;
  BOOST_CHECK( memory.read(b + pageSize, 3, data) == AccessResult::Success );
  BOOST_CHECK( data == std::vector<uint8_t>(3, 0) );

  memory.deallocate(b, 2 * pageSize);
  BOOST_CHECK_EQUAL( memory.getFreeFrameCount(), 8 );
  BOOST_CHECK_EQUAL( memory.getAddressSpace().getRegionCount(), 0 );
}

BOOST_AUTO_TEST_CASE( short_deallocate_discards_swapped_pages )
{
  MemoryManager memory(smallConfig(2, 4));

  uint64_t a, b;
  BOOST_REQUIRE( memory.allocate(2 * pageSize, AllocReadable | AllocWritable, a) );
  BOOST_CHECK( memory.write(a, bytes("x")) == AccessResult::Success );
  BOOST_CHECK( memory.write(a + pageSize, bytes("y")) == AccessResult::Success );

  // Pushes the first page of a out to swap
  BOOST_REQUIRE( memory.allocate(pageSize, AllocReadable | AllocWritable, b) );
  BOOST_REQUIRE( memory.getSwapStore().contains(pageNumber(a)) );

  memory.deallocate(a, 1);

  BOOST_CHECK_EQUAL( memory.getSwapStore().getPageCount(), 0 );
  BOOST_CHECK_EQUAL( memory.getPageTableSnapshot().size(), 1 );
  BOOST_CHECK_EQUAL( memory.getFreeFrameCount(), 1 );
  BOOST_CHECK_EQUAL( memory.getMemoryInfo().statistics.swapDiscards, 1 );
}

BOOST_FIXTURE_TEST_CASE( sign_extended_addresses, ManagerFixture )
{
  const uint64_t freeBefore = memory.getFreeFrameCount();
  const uint64_t signBits = 0xffff000000000000UL;

  uint64_t vAddr;
  BOOST_REQUIRE( memory.allocate(2 * pageSize, AllocReadable, vAddr) );

  BOOST_CHECK( memory.write(vAddr | signBits, bytes("no")) == AccessResult::PermissionDenied );

  std::vector<uint8_t> data;
  BOOST_CHECK( memory.read(vAddr | signBits, 2, data) == AccessResult::Success );

  memory.deallocate(vAddr | signBits, 2 * pageSize);
  BOOST_CHECK( memory.getPageTableSnapshot().empty() );
  BOOST_CHECK_EQUAL( memory.getFreeFrameCount(), freeBefore );
  BOOST_CHECK_EQUAL( memory.getAddressSpace().getRegionCount(), 0 );
}

BOOST_FIXTURE_TEST_CASE( tlb_agrees_with_page_table, ManagerFixture )
{
  uint64_t vAddr;
  BOOST_REQUIRE( memory.allocate(8 * pageSize, AllocReadable | AllocWritable, vAddr) );

  std::vector<uint8_t> data;
  for (uint64_t i = 0; i < 8; i++)
    BOOST_CHECK( memory.read(vAddr + i * pageSize, 1, data) == AccessResult::Success );

  TLB *tlb = memory.getTLB();
  BOOST_CHECK_EQUAL( tlb->size(), 8 );

  for (const auto &entry : memory.getPageTableSnapshot())
    {
      uint64_t pFrame;
      if (tlb->contains(entry.virtualPage))
        {
          BOOST_CHECK( tlb->lookup(entry.virtualPage, pFrame) );
          BOOST_CHECK_EQUAL( pFrame, entry.physicalFrame );
        }
    }

  memory.flush();
  BOOST_CHECK_EQUAL( tlb->size(), 0 );
}

BOOST_FIXTURE_TEST_CASE( page_fault_on_unbacked_page, ManagerFixture )
{
  uint64_t vAddr;
  BOOST_REQUIRE( memory.allocate(4096, AllocWritable, vAddr) );

  auto before = memory.getPageTableSnapshot();
  const uint64_t freeBefore = memory.getFreeFrameCount();

  BOOST_CHECK( memory.handlePageFault(0x7f0000000000UL) == false );

  BOOST_CHECK_EQUAL( memory.getPageTableSnapshot().size(), before.size() );
  BOOST_CHECK_EQUAL( memory.getFreeFrameCount(), freeBefore );

  MemoryInfo info = memory.getMemoryInfo();
  BOOST_CHECK_EQUAL( info.statistics.pageFaults, 1 );
  BOOST_CHECK_EQUAL( info.statistics.majorPageFaults, 1 );

  // A resident page needs no work
  BOOST_CHECK( memory.handlePageFault(vAddr) );
}

BOOST_FIXTURE_TEST_CASE( mmap_and_munmap, ManagerFixture )
{
  uint64_t vAddr;
  BOOST_REQUIRE( memory.mmap(4096, ProtRead, MapPrivate | MapAnonymous, vAddr) );
  BOOST_CHECK( memory.write(vAddr, bytes("x")) == AccessResult::PermissionDenied );

  uint64_t rw;
  BOOST_REQUIRE( memory.mmap(4096, ProtRead | ProtWrite, MapShared, rw) );
  BOOST_CHECK( memory.write(rw, bytes("x")) == AccessResult::Success );

  memory.munmap(vAddr, 4096);
  memory.munmap(rw, 4096);
  BOOST_CHECK( memory.getPageTableSnapshot().empty() );
}

BOOST_AUTO_TEST_CASE( missing_components )
{
  BOOST_CHECK_THROW( MemoryManager(nullptr, makeReplacementPolicy(ReplacementKind::LRU)),
                     std::invalid_argument );
  BOOST_CHECK_THROW( MemoryManager(std::make_unique<FrameAllocator>(4 * pageSize), nullptr),
                     std::invalid_argument );
}

/*
 * Memory pressure
 */

BOOST_AUTO_TEST_CASE( clean_victim_is_dropped )
{
  MemoryManager memory(smallConfig(4, 8));

  uint64_t a, b;
  BOOST_REQUIRE( memory.allocate(4 * pageSize, AllocReadable | AllocWritable, a) );
  BOOST_CHECK_EQUAL( memory.getFreeFrameCount(), 0 );

  // None of the pages were touched; the first one goes without a copy
  BOOST_REQUIRE( memory.allocate(pageSize, AllocReadable | AllocWritable, b) );

  MemoryInfo info = memory.getMemoryInfo();
  BOOST_CHECK_EQUAL( info.statistics.evictions, 1 );
  BOOST_CHECK_EQUAL( info.statistics.swapOuts, 0 );
  BOOST_CHECK_EQUAL( memory.getSwapStore().getPageCount(), 0 );

  auto entries = memory.getPageTableSnapshot();
  BOOST_CHECK_EQUAL( entries.size(), 4 );
  for (const auto &entry : entries)
    BOOST_CHECK( entry.virtualPage != pageNumber(a) );

  std::vector<uint8_t> data;
  BOOST_CHECK( memory.read(a, 1, data) == AccessResult::Fault );
}

BOOST_AUTO_TEST_CASE( dirty_victim_is_swapped )
{
  MemoryManager memory(smallConfig(4, 8));

  uint64_t a, b;
  BOOST_REQUIRE( memory.allocate(4 * pageSize, AllocReadable | AllocWritable, a) );
  for (uint64_t i = 0; i < 4; i++)
    BOOST_CHECK( memory.write(a + i * pageSize, bytes(std::string(1, static_cast<char>('a' + i)))) == AccessResult::Success );

  BOOST_REQUIRE( memory.allocate(pageSize, AllocReadable | AllocWritable, b) );

  MemoryInfo info = memory.getMemoryInfo();
  BOOST_CHECK_EQUAL( info.statistics.evictions, 1 );
  BOOST_CHECK_EQUAL( info.statistics.swapOuts, 1 );
  BOOST_CHECK_EQUAL( info.swapUsed, pageSize );
  BOOST_CHECK( memory.getSwapStore().contains(pageNumber(a)) );
  BOOST_CHECK( not memory.getTLB()->contains(pageNumber(a)) );

  // Reading the page brings it back, evicting the untouched page b
  std::vector<uint8_t> data;
  BOOST_CHECK( memory.read(a, 1, data) == AccessResult::Success );
  BOOST_CHECK( data == bytes("a") );

  info = memory.getMemoryInfo();
  BOOST_CHECK_EQUAL( info.statistics.pageFaults, 1 );
  BOOST_CHECK_EQUAL( info.statistics.swapIns, 1 );
  BOOST_CHECK_EQUAL( info.statistics.evictions, 2 );
  BOOST_CHECK_EQUAL( info.swapUsed, 0 );

  PageTableEntry entry;
  BOOST_CHECK( memory.getPageTable().lookup(pageNumber(a), entry) );
  BOOST_CHECK( entry.dirty );
  BOOST_CHECK( not memory.getPageTable().lookup(pageNumber(b), entry) );
}

BOOST_AUTO_TEST_CASE( explicit_swap_in )
{
  MemoryManager memory(smallConfig(1, 4));

  uint64_t a, b;
  BOOST_REQUIRE( memory.allocate(pageSize, AllocReadable | AllocWritable, a) );
  BOOST_CHECK( memory.write(a, bytes("data")) == AccessResult::Success );
  BOOST_REQUIRE( memory.allocate(pageSize, AllocReadable | AllocWritable, b) );
  BOOST_CHECK( memory.getSwapStore().contains(pageNumber(a)) );

  // b is clean, so it is dropped to make room
  BOOST_CHECK( memory.handlePageFault(a + 2) );
  BOOST_CHECK( not memory.getSwapStore().contains(pageNumber(a)) );

  std::vector<uint8_t> data;
  BOOST_CHECK( memory.read(a, 4, data) == AccessResult::Success );
  BOOST_CHECK( data == bytes("data") );
}

BOOST_AUTO_TEST_CASE( swap_full )
{
  MemoryManager memory(smallConfig(2, 0));

  uint64_t a, b;
  BOOST_REQUIRE( memory.allocate(2 * pageSize, AllocReadable | AllocWritable, a) );
  BOOST_CHECK( memory.write(a, bytes("x")) == AccessResult::Success );
  BOOST_CHECK( memory.write(a + pageSize, bytes("y")) == AccessResult::Success );

  // Both pages are dirty and there is no room to write either out
  BOOST_CHECK( memory.allocate(pageSize, AllocWritable, b) == false );

  MemoryInfo info = memory.getMemoryInfo();
  BOOST_CHECK_EQUAL( info.statistics.allocationFailures, 1 );
  BOOST_CHECK_EQUAL( info.statistics.evictions, 0 );
  BOOST_CHECK_EQUAL( info.freeVirtual, info.totalVirtual - 3 * pageSize );
  BOOST_CHECK_EQUAL( memory.getPageTableSnapshot().size(), 2 );

  std::vector<uint8_t> data;
  BOOST_CHECK( memory.read(a + pageSize, 1, data) == AccessResult::Success );
  BOOST_CHECK( data == bytes("y") );
}

BOOST_AUTO_TEST_CASE( swap_limit_advisory )
{
  MemoryConfig config = smallConfig(2, 0);
  config.enforceSwapLimit = false;
  MemoryManager memory(config);

  uint64_t a, b;
  BOOST_REQUIRE( memory.allocate(2 * pageSize, AllocReadable | AllocWritable, a) );
  BOOST_CHECK( memory.write(a, bytes("x")) == AccessResult::Success );
  BOOST_CHECK( memory.write(a + pageSize, bytes("y")) == AccessResult::Success );

  BOOST_CHECK( memory.allocate(pageSize, AllocWritable, b) );
  BOOST_CHECK_EQUAL( memory.getMemoryInfo().swapUsed, pageSize );
}

BOOST_AUTO_TEST_CASE( allocation_larger_than_memory )
{
  MemoryManager memory(smallConfig(2, 8));

  // Pages of one allocation never evict each other
  uint64_t vAddr;
  BOOST_CHECK( memory.allocate(3 * pageSize, AllocWritable, vAddr) == false );
  BOOST_CHECK_EQUAL( memory.getFreeFrameCount(), 2 );
  BOOST_CHECK( memory.getPageTableSnapshot().empty() );
  BOOST_CHECK_EQUAL( memory.getAddressSpace().getRegionCount(), 0 );
}

BOOST_AUTO_TEST_CASE( deallocate_discards_swap_copy )
{
  MemoryManager memory(smallConfig(1, 4));

  uint64_t a, b;
  BOOST_REQUIRE( memory.allocate(pageSize, AllocReadable | AllocWritable, a) );
  BOOST_CHECK( memory.write(a, bytes("gone")) == AccessResult::Success );
  BOOST_REQUIRE( memory.allocate(pageSize, AllocReadable | AllocWritable, b) );
  BOOST_CHECK_EQUAL( memory.getSwapStore().getPageCount(), 1 );

  memory.deallocate(a, pageSize);

  BOOST_CHECK_EQUAL( memory.getSwapStore().getPageCount(), 0 );
  BOOST_CHECK_EQUAL( memory.getMemoryInfo().statistics.swapDiscards, 1 );
  BOOST_CHECK_EQUAL( memory.getPageTableSnapshot().size(), 1 );
}

BOOST_AUTO_TEST_CASE( clock_policy_under_pressure )
{
  MemoryManager memory(smallConfig(2, 4, ReplacementKind::Clock));
  BOOST_CHECK( memory.getPolicy().getKind() == ReplacementKind::Clock );

  uint64_t a, b;
  BOOST_REQUIRE( memory.allocate(2 * pageSize, AllocReadable | AllocWritable, a) );
  BOOST_CHECK( memory.write(a, bytes("1")) == AccessResult::Success );

  // The first page was accessed and gets a second chance
  BOOST_REQUIRE( memory.allocate(pageSize, AllocReadable | AllocWritable, b) );

  PageTableEntry entry;
  BOOST_CHECK( memory.getPageTable().lookup(pageNumber(a), entry) );
  BOOST_CHECK( not entry.accessed );
  BOOST_CHECK( not memory.getPageTable().lookup(pageNumber(a) + 1, entry) );
  BOOST_CHECK_EQUAL( memory.getMemoryInfo().statistics.swapOuts, 0 );
}

/*
 * Concurrent use
 */

BOOST_AUTO_TEST_CASE( concurrent_operations )
{
  MemoryManager memory;
  std::atomic<int> failures(0);
  std::atomic<bool> done(false);

  auto worker = [&memory, &failures](int id) {
    for (int i = 0; i < 50; i++) {
      uint64_t vAddr;
      if (not memory.allocate(2 * pageSize, AllocReadable | AllocWritable, vAddr)) {
        failures++;
        continue;
      }

      std::vector<uint8_t> data(16, static_cast<uint8_t>(id));
      std::vector<uint8_t> back;
      if (memory.write(vAddr + pageSize - 8, data) != AccessResult::Success
          or memory.read(vAddr + pageSize - 8, 16, back) != AccessResult::Success
          or back != data)
        failures++;

      memory.deallocate(vAddr, 2 * pageSize);
    }
  };

  std::thread observer([&memory, &done, &failures]() {
    while (not done) {
      for (const auto &entry : memory.getPageTableSnapshot())
        if (not entry.isPresent())
          failures++;
    }
  });

  std::vector<std::thread> workers;
  for (int id = 1; id <= 4; id++)
    workers.emplace_back(worker, id);
  for (auto &t : workers)
    t.join();

  done = true;
  observer.join();

  BOOST_CHECK_EQUAL( failures.load(), 0 );
  BOOST_CHECK( memory.getPageTableSnapshot().empty() );
  BOOST_CHECK_EQUAL( memory.getFreeFrameCount(), DefaultMemorySize / pageSize );
  BOOST_CHECK_EQUAL( memory.getMemoryInfo().statistics.allocations, 200 );
}

BOOST_AUTO_TEST_SUITE_END()
