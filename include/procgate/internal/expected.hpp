#pragma once

#include <new>
#include <type_traits>
#include <utility>

namespace procgate {

template <typename E>
class unexpected {
 public:
  explicit unexpected(const E& error) : error_(error) {}
  explicit unexpected(E&& error) : error_(std::move(error)) {}

  [[nodiscard]] const E& error() const& noexcept { return error_; }
  [[nodiscard]] E& error() & noexcept { return error_; }
  [[nodiscard]] E&& error() && noexcept { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
unexpected(E) -> unexpected<E>;

// Minimal stand-in for std::expected used before C++23. Only the members
// procgate relies on are provided.
template <typename T, typename E>
class expected {
 public:
  using value_type = T;
  using error_type = E;

  expected(const T& value) : has_value_(true) { ::new (value_ptr()) T(value); }
  expected(T&& value) : has_value_(true) { ::new (value_ptr()) T(std::move(value)); }

  expected(const unexpected<E>& err) { ::new (error_ptr()) E(err.error()); }
  expected(unexpected<E>&& err) { ::new (error_ptr()) E(std::move(err.error())); }
  expected(const E& err) { ::new (error_ptr()) E(err); }
  expected(E&& err) { ::new (error_ptr()) E(std::move(err)); }

  expected(const expected& other) : has_value_(other.has_value_) { construct_from(other); }
  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible_v<T>&& std::is_nothrow_move_constructible_v<E>)
      : has_value_(other.has_value_) {
    construct_from(std::move(other));
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      construct_from(other);
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible_v<T>&& std::is_nothrow_move_constructible_v<E>) {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      construct_from(std::move(other));
    }
    return *this;
  }

  ~expected() { reset(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  [[nodiscard]] T& value() & { return *value_ptr(); }
  [[nodiscard]] const T& value() const& { return *value_ptr(); }
  [[nodiscard]] T&& value() && { return std::move(*value_ptr()); }

  [[nodiscard]] T& operator*() & noexcept { return *value_ptr(); }
  [[nodiscard]] const T& operator*() const& noexcept { return *value_ptr(); }
  [[nodiscard]] T* operator->() noexcept { return value_ptr(); }
  [[nodiscard]] const T* operator->() const noexcept { return value_ptr(); }

  [[nodiscard]] E& error() & { return *error_ptr(); }
  [[nodiscard]] const E& error() const& { return *error_ptr(); }
  [[nodiscard]] E&& error() && { return std::move(*error_ptr()); }

 private:
  [[nodiscard]] T* value_ptr() noexcept { return std::launder(reinterpret_cast<T*>(&storage_)); }
  [[nodiscard]] const T* value_ptr() const noexcept {
    return std::launder(reinterpret_cast<const T*>(&storage_));
  }
  [[nodiscard]] E* error_ptr() noexcept { return std::launder(reinterpret_cast<E*>(&storage_)); }
  [[nodiscard]] const E* error_ptr() const noexcept {
    return std::launder(reinterpret_cast<const E*>(&storage_));
  }

  template <typename Other>
  void construct_from(Other&& other) {
    if (has_value_) {
      ::new (value_ptr()) T(std::forward<Other>(other).value_ref());
    } else {
      ::new (error_ptr()) E(std::forward<Other>(other).error_ref());
    }
  }

  const T& value_ref() const& { return *value_ptr(); }
  T&& value_ref() && { return std::move(*value_ptr()); }
  const E& error_ref() const& { return *error_ptr(); }
  E&& error_ref() && { return std::move(*error_ptr()); }

  void reset() {
    if (has_value_) {
      value_ptr()->~T();
    } else {
      error_ptr()->~E();
    }
  }

  bool has_value_{false};
  alignas(T) alignas(E) unsigned char storage_[sizeof(T) > sizeof(E) ? sizeof(T) : sizeof(E)];
};

template <typename E>
class expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  expected() : has_value_(true) {}
  expected(const unexpected<E>& err) : error_(err.error()) {}
  expected(unexpected<E>&& err) : error_(std::move(err.error())) {}
  expected(const E& err) : error_(err) {}
  expected(E&& err) : error_(std::move(err)) {}

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  void value() const {}

  [[nodiscard]] E& error() & { return error_; }
  [[nodiscard]] const E& error() const& { return error_; }
  [[nodiscard]] E&& error() && { return std::move(error_); }

 private:
  bool has_value_{false};
  E error_{};
};

}  // namespace procgate
