#pragma once
// =============================================================================
// fixrec - Core Types (C++20)
// Version: 1.0.0
// =============================================================================

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <span>
#include <optional>
#include <variant>
#include <memory>
#include <functional>
#include <chrono>
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <format>
#include <concepts>
#include <type_traits>
#include <filesystem>
#include <source_location>
#include <unordered_map>
#include <algorithm>

namespace fixrec {

// =============================================================================
// Fundamental Types
// =============================================================================
using Byte = std::uint8_t;
using Int8 = std::int8_t;
using UInt8 = std::uint8_t;
using Int16 = std::int16_t;
using UInt16 = std::uint16_t;
using Int32 = std::int32_t;
using UInt32 = std::uint32_t;
using Int64 = std::int64_t;
using UInt64 = std::uint64_t;
using Float32 = float;
using Float64 = double;
using Size = std::size_t;

// =============================================================================
// String Types
// =============================================================================
using String = std::string;
using StringView = std::string_view;

// =============================================================================
// Container Types
// =============================================================================
using ByteBuffer = std::vector<Byte>;
using ByteSpan = std::span<Byte>;
using ConstByteSpan = std::span<const Byte>;
template<typename T> using Vector = std::vector<T>;

// =============================================================================
// Smart Pointers
// =============================================================================
template<typename T> using UniquePtr = std::unique_ptr<T>;
template<typename T> using SharedPtr = std::shared_ptr<T>;

// =============================================================================
// Optional and Variant
// =============================================================================
template<typename T> using Optional = std::optional<T>;
template<typename... Ts> using Variant = std::variant<Ts...>;
inline constexpr std::nullopt_t nullopt = std::nullopt;

// =============================================================================
// Time Types
// =============================================================================
using Clock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using SystemTimePoint = SystemClock::time_point;
using Duration = Clock::duration;
using Microseconds = std::chrono::microseconds;
using Milliseconds = std::chrono::milliseconds;

// =============================================================================
// Filesystem
// =============================================================================
using Path = std::filesystem::path;

// =============================================================================
// C++20 Concepts
// =============================================================================
template<typename T>
concept Integral = std::is_integral_v<T>;

template<typename T>
concept FloatingPoint = std::is_floating_point_v<T>;

template<typename T>
concept Numeric = Integral<T> || FloatingPoint<T>;

// =============================================================================
// FixedString - Mainframe-style fixed-length string
// =============================================================================
template<Size N>
class FixedString {
private:
    std::array<char, N> data_{};
    
public:
    static constexpr Size capacity = N;

    constexpr FixedString() noexcept { data_.fill(' '); }
    
    constexpr FixedString(StringView sv) noexcept {
        data_.fill(' ');
        Size len = std::min(sv.size(), N);
        for (Size i = 0; i < len; ++i) data_[i] = sv[i];
    }
    
    [[nodiscard]] constexpr Size length() const noexcept { return N; }
    [[nodiscard]] constexpr Size size() const noexcept { return N; }
    [[nodiscard]] constexpr const char* data() const noexcept { return data_.data(); }
    [[nodiscard]] constexpr char* data() noexcept { return data_.data(); }
    
    [[nodiscard]] String str() const { return String(data_.data(), N); }
    
    [[nodiscard]] String trimmed() const {
        Size end = N;
        while (end > 0 && data_[end - 1] == ' ') --end;
        return String(data_.data(), end);
    }
    
    constexpr char& operator[](Size i) { return data_[i]; }
    constexpr const char& operator[](Size i) const { return data_[i]; }
    
    constexpr auto operator<=>(const FixedString&) const = default;
    constexpr bool operator==(const FixedString&) const = default;
    
    [[nodiscard]] constexpr bool empty() const noexcept {
        for (Size i = 0; i < N; ++i) if (data_[i] != ' ') return false;
        return true;
    }
    
    constexpr void clear() noexcept { data_.fill(' '); }
};

// =============================================================================
// BufferView - Zero-copy view over a raw record
// =============================================================================
class BufferView {
private:
    const char* data_ = nullptr;
    Size size_ = 0;
    
public:
    constexpr BufferView() noexcept = default;
    constexpr BufferView(const char* data, Size size) noexcept : data_(data), size_(size) {}
    constexpr BufferView(StringView sv) noexcept : data_(sv.data()), size_(sv.size()) {}
    BufferView(const String& s) noexcept : data_(s.data()), size_(s.size()) {}
    BufferView(const char* cstr) noexcept : BufferView(StringView(cstr)) {}
    BufferView(ConstByteSpan span) noexcept
        : data_(reinterpret_cast<const char*>(span.data())), size_(span.size()) {}
    BufferView(const ByteBuffer& buf) noexcept
        : data_(reinterpret_cast<const char*>(buf.data())), size_(buf.size()) {}
    
    [[nodiscard]] constexpr const char* data() const noexcept { return data_; }
    [[nodiscard]] constexpr Size size() const noexcept { return size_; }
    [[nodiscard]] constexpr bool empty() const noexcept { return size_ == 0; }
    
    [[nodiscard]] constexpr char operator[](Size i) const { return data_[i]; }
    [[nodiscard]] constexpr const char* begin() const noexcept { return data_; }
    [[nodiscard]] constexpr const char* end() const noexcept { return data_ + size_; }
    
    // Clipped to the end of the view; an offset past the end yields an empty view.
    [[nodiscard]] constexpr BufferView subview(Size offset, Size count) const {
        if (offset >= size_) return {};
        return BufferView(data_ + offset, std::min(count, size_ - offset));
    }
    
    [[nodiscard]] constexpr BufferView subview(Size offset) const {
        if (offset >= size_) return {};
        return BufferView(data_ + offset, size_ - offset);
    }
    
    [[nodiscard]] constexpr StringView str() const noexcept { return {data_, size_}; }
    [[nodiscard]] String to_string() const { return String(data_, size_); }
};

// =============================================================================
// AtomicCounter - Thread-safe counter
// =============================================================================
template<typename T = UInt64>
class AtomicCounter {
private:
    std::atomic<T> value_{0};
    
public:
    AtomicCounter() = default;
    explicit AtomicCounter(T initial) : value_(initial) {}
    
    T operator++() noexcept { return value_.fetch_add(1, std::memory_order_relaxed) + 1; }
    T operator++(int) noexcept { return value_.fetch_add(1, std::memory_order_relaxed); }
    T operator+=(T v) noexcept { return value_.fetch_add(v, std::memory_order_relaxed) + v; }
    
    [[nodiscard]] T get() const noexcept { return value_.load(std::memory_order_relaxed); }
    void reset() noexcept { value_.store(0, std::memory_order_relaxed); }
    
    operator T() const noexcept { return get(); }
};

// =============================================================================
// String Utilities
// =============================================================================
[[nodiscard]] String to_upper(StringView str);
[[nodiscard]] String to_lower(StringView str);
[[nodiscard]] String trim(StringView str);
[[nodiscard]] std::vector<String> split(StringView str, char delimiter);
[[nodiscard]] String join(const std::vector<String>& strings, StringView delimiter);
[[nodiscard]] String pad_right(StringView str, Size width, char pad = ' ');

// Printable rendering of raw record bytes for diagnostics
[[nodiscard]] String printable(StringView raw, Size max_length = 64);

} // namespace fixrec
