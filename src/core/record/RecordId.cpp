#include "RecordId.hpp"

#include <atomic>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <random>

namespace vault {

namespace {

std::string hexn(uint64_t v, int n) {
  static const char* k = "0123456789abcdef";
  std::string s(n, '0');
  for (int i = n - 1; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
  return s;
}

struct ProcessSeed {
  uint64_t random40;
  std::atomic<uint32_t> counter;

  ProcessSeed() {
    std::mt19937_64 rng{std::random_device{}()};
    random40 = rng() & 0xffffffffffULL;
    counter.store(static_cast<uint32_t>(rng() & 0xffffffULL));
  }
};

ProcessSeed& seed() {
  static ProcessSeed s;
  return s;
}

} // namespace

std::string generate_record_id() {
  auto& s = seed();
  const uint64_t secs = static_cast<uint64_t>(std::time(nullptr)) & 0xffffffffULL;
  const uint32_t count = s.counter.fetch_add(1) & 0xffffffU;
  return hexn(secs, 8) + hexn(s.random40, 10) + hexn(count, 6);
}

bool is_valid_record_id(const std::string& id) {
  if (id.size() != kRecordIdLength) return false;
  for (unsigned char c : id) {
    if (!std::isxdigit(c)) return false;
  }
  return true;
}

std::string normalize_record_id(const std::string& id) {
  std::string out = id;
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

} // namespace vault
