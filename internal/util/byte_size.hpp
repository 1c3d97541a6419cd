#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace upload::util {

inline constexpr std::uint64_t kKiB = 1024ULL;
inline constexpr std::uint64_t kMiB = 1024ULL * kKiB;
inline constexpr std::uint64_t kGiB = 1024ULL * kMiB;
inline constexpr std::uint64_t kTiB = 1024ULL * kGiB;

/*
  Parses human readable sizes: "4096", "5MB", "128MiB", "1.5 GiB", "64k".

  SI suffixes (kB, MB, GB, TB) are powers of 1000, IEC suffixes (KiB, MiB,
  GiB, TiB) powers of 1024. A bare K/M/G/T is treated as IEC.
  Throws InvalidArgument on malformed input.
*/
std::uint64_t ParseByteSize(std::string_view text);

std::string FormatByteSize(std::uint64_t bytes);

} // namespace upload::util
