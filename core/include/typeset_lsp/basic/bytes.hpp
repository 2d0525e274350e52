// typeset_lsp/basic/bytes.hpp - Shared immutable byte buffer
#pragma once

#include <cstddef>
#include <gsl/span>
#include <memory>
#include <string_view>
#include <vector>

namespace typeset_lsp
{

/**
 * Cheaply copyable, immutable byte buffer (images, fonts, other binary
 * resources). Copies share the same storage.
 */
class Bytes
{
public:
  Bytes() : data_(std::make_shared<const std::vector<std::byte>>()) {}

  explicit Bytes(std::vector<std::byte> data)
  : data_(std::make_shared<const std::vector<std::byte>>(std::move(data)))
  {
  }

  [[nodiscard]] static Bytes from_string(std::string_view s)
  {
    std::vector<std::byte> data(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
      data[i] = static_cast<std::byte>(s[i]);
    }
    return Bytes(std::move(data));
  }

  [[nodiscard]] gsl::span<const std::byte> span() const noexcept
  {
    return gsl::span<const std::byte>(data_->data(), data_->size());
  }

  [[nodiscard]] size_t size() const noexcept { return data_->size(); }
  [[nodiscard]] bool empty() const noexcept { return data_->empty(); }

  /// True if both handles share the same storage
  [[nodiscard]] bool same_storage(const Bytes & other) const noexcept
  {
    return data_ == other.data_;
  }

  [[nodiscard]] bool operator==(const Bytes & other) const { return *data_ == *other.data_; }

private:
  std::shared_ptr<const std::vector<std::byte>> data_;
};

}  // namespace typeset_lsp
