#pragma once

// Branch prediction hints
#define LIKELY(x) __builtin_expect(!!(x), 1)
#define UNLIKELY(x) __builtin_expect(!!(x), 0)

// CPU pause for spin loops
#if defined(__x86_64__) || defined(__i386__)
  #define CPU_PAUSE() __builtin_ia32_pause()
#else
  #define CPU_PAUSE() do { } while (0)
#endif

// Cache line alignment
#define CACHE_LINE_SIZE 64
#define CACHE_ALIGNED alignas(CACHE_LINE_SIZE)
