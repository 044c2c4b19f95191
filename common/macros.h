#pragma once

// Branch hints
#define LIKELY(x) __builtin_expect(!!(x), 1)
#define UNLIKELY(x) __builtin_expect(!!(x), 0)

// Failure paths: diagnostic construction, usage printing
#define COLD_FUNCTION __attribute__((cold))
