#pragma once

#include <string>
#include <chrono>
#include <cstdint>

// Human-readable elapsed time: "850ms", "12s", "3m05s", "1h02m".
std::string format_elapsed(std::chrono::milliseconds elapsed);

// Human-readable byte count with binary units: "512 B", "1.5 KiB", "3.2 GiB".
std::string format_bytes(uint64_t bytes);

// Transfer rate over an elapsed interval: "12.4 MiB/s", or "-" if elapsed is zero.
std::string format_rate(uint64_t bytes, std::chrono::milliseconds elapsed);
