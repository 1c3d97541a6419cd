#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"

namespace {

using upload::util::HashLocalFile;
using upload::util::Sha256;
using upload::util::Sha256Hex;

constexpr char kEmpty[] = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr char kAbc[]   = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

void TestKnownDigests() {
  assert(Sha256Hex("") == kEmpty);
  assert(Sha256Hex("abc") == kAbc);
}

void TestIncrementalMatchesOneShot() {
  std::string data(10000, '\0');
  for (std::size_t i = 0; i < data.size(); ++i) {
    data[i] = static_cast<char>(i % 253);
  }

  Sha256 hasher;
  hasher.Update(data.data(), 1);
  hasher.Update(data.data() + 1, 4095);
  hasher.Update(data.data() + 4096, data.size() - 4096);
  assert(hasher.HexDigest() == Sha256Hex(data));
}

void TestUpdateAfterDigestThrows() {
  Sha256 hasher;
  hasher.Update("a", 1);
  hasher.HexDigest();

  bool threw = false;
  try {
    hasher.Update("b", 1);
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

void TestHashLocalFile() {
  auto path = std::filesystem::temp_directory_path() /
              ("sha256_test_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".bin");
  {
    std::ofstream out(path, std::ios::binary);
    out << "abc";
  }

  auto file = HashLocalFile(path.string());
  assert(file.size == 3);
  assert(file.sha256 == kAbc);

  std::filesystem::remove(path);

  bool threw = false;
  try {
    HashLocalFile(path.string());
  } catch (const upload::util::PlanningError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestKnownDigests();
  TestIncrementalMatchesOneShot();
  TestUpdateAfterDigestThrows();
  TestHashLocalFile();

  std::cout << "upload_engine_unit_sha256: pass\n";
  return 0;
}
