#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/byte_size.hpp"
#include "internal/util/errors.hpp"

namespace {

using upload::util::ParseByteSize;

void TestPlainAndSuffixedSizes() {
  assert(ParseByteSize("4096") == 4096);
  assert(ParseByteSize("5MB") == 5000000);
  assert(ParseByteSize("5MiB") == 5 * upload::util::kMiB);
  assert(ParseByteSize("128mib") == 128 * upload::util::kMiB);
  assert(ParseByteSize("64k") == 64 * upload::util::kKiB);
  assert(ParseByteSize("1.5 GiB") == 3 * upload::util::kGiB / 2);
  assert(ParseByteSize("1_000_000") == 1000000);
}

void TestMalformedSizesAreRejected() {
  for (const std::string text : {"", "MiB", "12XB", "1.2.3MB", "-5"}) {
    bool threw = false;
    try {
      (void)ParseByteSize(text);
    } catch (const upload::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw && "malformed byte size must be rejected");
  }
}

void TestFormatting() {
  assert(upload::util::FormatByteSize(512) == "512 B");
  assert(upload::util::FormatByteSize(1536) == "1.5 KiB");
  assert(upload::util::FormatByteSize(128 * upload::util::kMiB) == "128.0 MiB");
}

} // namespace

int main() {
  TestPlainAndSuffixedSizes();
  TestMalformedSizesAreRejected();
  TestFormatting();

  std::cout << "upload_engine_unit_byte_size: pass\n";
  return 0;
}
