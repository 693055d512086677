#include <blake3.h>
#include <warden/blake3/hash.hpp>

namespace warden::blake3 {

namespace {

struct hasher final {
  hasher() { blake3_hasher_init(&state); }

  void update(const void* data, const std::size_t size) {
    blake3_hasher_update(&state, data, size);
  }

  warden::schema::hash32_t finalize() {
    auto output = warden::schema::hash32_t{};
    blake3_hasher_finalize(&state, output.data(), output.size());
    return output;
  }

  blake3_hasher state{};
};

}  // namespace

warden::schema::hash32_t hash(const std::string_view& str) {
  auto h = hasher{};
  h.update(str.data(), str.size());
  return h.finalize();
}

warden::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  auto h = hasher{};
  h.update(bytes.data(), bytes.size());
  return h.finalize();
}

warden::schema::hash32_t hash(
    std::initializer_list<std::span<const uint8_t>> parts) {
  auto h = hasher{};
  for (const auto& part : parts) {
    h.update(part.data(), part.size());
  }
  return h.finalize();
}

}  // namespace warden::blake3
