#pragma once

#include <cstdint>

namespace hiyo {

struct MemoryReading {
  uint64_t resident_bytes{0}; // 0 = could not be read.
  uint64_t physical_bytes{0}; // 0 = could not be read.
};

// Source of process/system memory figures for the Resource Governor's
// memory-pressure check. Implementations must be thread-safe.
class MemoryProbe {
public:
  virtual ~MemoryProbe() = default;
  virtual MemoryReading Read() const = 0;
};

// Linux implementation: resident set size from /proc/self/statm and physical
// memory from sysconf(_SC_PHYS_PAGES).
class ProcMemoryProbe : public MemoryProbe {
public:
  MemoryReading Read() const override;
};

} // namespace hiyo
