/* vmcore -- A single address space virtual memory manager
 *
 *    vmsim.cc - Replays a memory trace against the memory manager
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "os/memorymanager.h"
#include "os/syscalls.h"

#include <getopt.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace VMCore;

struct Allocation
{
  uint64_t addr;
  uint64_t size;
};

static void
showUsage(const char *progName)
{
  std::cerr << "usage: " << progName
            << " [-m memsize] [-s swapsize] [-t tlbentries] [-a l|c] [-x]"
            << " [-v] [-f] [-e] [-S] [tracefile]" << std::endl
            << std::endl
            << "  -m  physical memory size, K/M/G suffixes allowed" << std::endl
            << "  -s  swap size (default: twice the memory size)" << std::endl
            << "  -t  number of TLB entries" << std::endl
            << "  -a  replacement policy: l (LRU, default) or c (clock)" << std::endl
            << "  -x  do not enforce the swap size limit" << std::endl
            << "  -v  log memory accesses" << std::endl
            << "  -f  log page faults" << std::endl
            << "  -e  log evictions and swap traffic" << std::endl
            << "  -S  print TLB statistics on exit" << std::endl;
}

static uint32_t
parseAllocFlags(const std::string &text)
{
  uint32_t flags = 0;
  for (char c : text)
    {
      switch (c)
        {
          case 'r': flags |= AllocReadable; break;
          case 'w': flags |= AllocWritable; break;
          case 'x': flags |= AllocExecutable; break;
          case 'u': flags |= AllocUser; break;
          case 'k': flags |= AllocKernel; break;
          default:
            throw std::runtime_error(std::string("unknown allocation flag '") + c + "'");
        }
    }
  return flags;
}

static std::string
printable(const std::vector<uint8_t> &data)
{
  std::string text;
  for (uint8_t byte : data)
    text += std::isprint(byte) ? static_cast<char>(byte) : '.';
  return text;
}

class TraceRunner
{
  protected:
    MemoryManager &memory;
    std::map<std::string, Allocation> allocations;

    const Allocation &getAllocation(const std::string &name) const;
    void execute(const std::string &command, std::istringstream &args);

  public:
    explicit TraceRunner(MemoryManager &memory) : memory(memory), allocations() {}

    void run(std::istream &trace);
};

const Allocation &
TraceRunner::getAllocation(const std::string &name) const
{
  auto it = allocations.find(name);
  if (it == allocations.end())
    throw std::runtime_error("unknown allocation '" + name + "'");
  return it->second;
}

void
TraceRunner::execute(const std::string &command, std::istringstream &args)
{
  std::string name;

  if (command == "info")
    {
      std::cout << memory.getMemoryInfo();
      return;
    }

  if (not (args >> name))
    throw std::runtime_error("missing allocation name");

  if (command == "alloc")
    {
      std::string sizeText, flagsText = "rw";
      uint64_t size = 0;
      if (not (args >> sizeText) or not parseSize(sizeText, size))
        throw std::runtime_error("bad size");
      args >> flagsText;

      uint64_t addr = 0;
      if (memory.allocate(size, parseAllocFlags(flagsText), addr))
        {
          allocations[name] = Allocation{ addr, size };
          std::cout << "alloc " << name << ": " << std::hex << std::showbase
                    << addr << std::dec << std::endl;
        }
      else
        std::cout << "alloc " << name << ": failed" << std::endl;
    }
  else if (command == "free")
    {
      const Allocation allocation = getAllocation(name);
      memory.deallocate(allocation.addr, allocation.size);
      allocations.erase(name);
      std::cout << "free " << name << std::endl;
    }
  else if (command == "write")
    {
      uint64_t offset = 0;
      std::string text;
      if (not (args >> offset))
        throw std::runtime_error("bad offset");
      std::getline(args >> std::ws, text);

      const std::vector<uint8_t> data(text.begin(), text.end());
      AccessResult result = memory.write(getAllocation(name).addr + offset, data);
      std::cout << "write " << name << "+" << offset << ": " << result << std::endl;
    }
  else if (command == "read")
    {
      uint64_t offset = 0, length = 0;
      if (not (args >> offset >> length))
        throw std::runtime_error("bad offset or length");

      std::vector<uint8_t> data;
      AccessResult result = memory.read(getAllocation(name).addr + offset, length, data);
      std::cout << "read " << name << "+" << offset << ": " << result;
      if (result == AccessResult::Success)
        std::cout << " \"" << printable(data) << "\"";
      std::cout << std::endl;
    }
  else if (command == "mmap")
    {
      SyscallArguments sysArgs;
      int64_t value = 0;
      while (args >> value)
        sysArgs.push_back(value);

      SyscallResult result = sysMmap(memory, sysArgs);
      std::cout << "mmap " << name << ": " << result.status;
      if (result.status == SyscallStatus::Success)
        {
          allocations[name] = Allocation{ result.value, static_cast<uint64_t>(sysArgs[0]) };
          std::cout << " " << std::hex << std::showbase << result.value << std::dec;
        }
      std::cout << std::endl;
    }
  else if (command == "munmap")
    {
      const Allocation allocation = getAllocation(name);
      SyscallArguments sysArgs{ static_cast<int64_t>(allocation.addr),
                                static_cast<int64_t>(allocation.size) };
      SyscallResult result = sysMunmap(memory, sysArgs);
      if (result.status == SyscallStatus::Success)
        allocations.erase(name);
      std::cout << "munmap " << name << ": " << result.status << std::endl;
    }
  else if (command == "fault")
    {
      uint64_t offset = 0;
      if (not (args >> offset))
        throw std::runtime_error("bad offset");

      bool resolved = memory.handlePageFault(getAllocation(name).addr + offset);
      std::cout << "fault " << name << "+" << offset << ": "
                << (resolved ? "resolved" : "major fault") << std::endl;
    }
  else
    throw std::runtime_error("unknown command '" + command + "'");
}

void
TraceRunner::run(std::istream &trace)
{
  std::string line;
  size_t lineNo = 0;

  while (std::getline(trace, line))
    {
      ++lineNo;

      std::istringstream args(line);
      std::string command;
      if (not (args >> command) or command[0] == '#')
        continue;

      try
        {
          execute(command, args);
        }
      catch (const std::runtime_error &e)
        {
          throw std::runtime_error("line " + std::to_string(lineNo) + ": " + e.what());
        }
    }
}

int
main(int argc, char **argv)
{
  const char *progName = argv[0];
  MemoryConfig config;
  bool swapSizeGiven = false;

  int ch;
  while ((ch = getopt(argc, argv, "m:s:t:a:xvfeSh")) != -1)
    {
      switch (ch)
        {
          case 'm':
            if (not parseSize(optarg, config.memorySize))
              {
                std::cerr << "invalid memory size: " << optarg << std::endl;
                return 1;
              }
            break;

          case 's':
            if (not parseSize(optarg, config.swapSize))
              {
                std::cerr << "invalid swap size: " << optarg << std::endl;
                return 1;
              }
            swapSizeGiven = true;
            break;

          case 't':
            config.tlbEntries = std::strtoul(optarg, nullptr, 10);
            break;

          case 'a':
            if (not parseReplacementKind(optarg, config.policy))
              {
                std::cerr << "unknown replacement policy: " << optarg << std::endl;
                return 1;
              }
            break;

          case 'x':
            config.enforceSwapLimit = false;
            break;

          case 'v':
            LogMemoryAccesses = true;
            break;

          case 'f':
            LogPageFaults = true;
            break;

          case 'e':
            LogEvictions = true;
            break;

          case 'S':
            LogTLBStatistics = true;
            break;

          case 'h':
          default:
            showUsage(progName);
            return ch == 'h' ? 0 : 1;
        }
    }

  argc -= optind;
  argv += optind;

  if (argc > 1)
    {
      showUsage(progName);
      return 1;
    }

  if (not swapSizeGiven)
    config.swapSize = DefaultSwapFactor * config.memorySize;

  try
    {
      MemoryManager memory(config);
      TraceRunner runner(memory);

      std::cerr << "vmsim: " << config.policy << " replacement, "
                << config.tlbEntries << " TLB entries" << std::endl;

      if (argc == 0 or std::string(argv[0]) == "-")
        runner.run(std::cin);
      else
        {
          std::ifstream trace(argv[0]);
          if (not trace)
            throw std::runtime_error(std::string("cannot open trace file ") + argv[0]);
          runner.run(trace);
        }

      memory.flush();
      std::cout << memory.getMemoryInfo();
    }
  catch (const std::exception &e)
    {
      std::cerr << "error: " << e.what() << std::endl;
      return 1;
    }

  return 0;
}
