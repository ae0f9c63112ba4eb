#include "scheduler/memory_probe.h"

#include <unistd.h>

#include <fstream>

namespace hiyo {

MemoryReading ProcMemoryProbe::Read() const {
  MemoryReading reading;
  long page_size = sysconf(_SC_PAGESIZE);
  if (page_size <= 0) {
    return reading;
  }

  // statm: size resident shared text lib data dt (all in pages).
  std::ifstream statm("/proc/self/statm");
  uint64_t size_pages = 0;
  uint64_t resident_pages = 0;
  if (statm >> size_pages >> resident_pages) {
    reading.resident_bytes = resident_pages * static_cast<uint64_t>(page_size);
  }

  long phys_pages = sysconf(_SC_PHYS_PAGES);
  if (phys_pages > 0) {
    reading.physical_bytes =
        static_cast<uint64_t>(phys_pages) * static_cast<uint64_t>(page_size);
  }
  return reading;
}

} // namespace hiyo
