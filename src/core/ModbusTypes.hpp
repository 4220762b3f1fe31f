/**
 * @file ModbusTypes.hpp
 * @brief General-purpose types used across the MBCodec library
 */

#pragma once

#include <cstring>
#include <cstdint>
#include <cstddef>
#include <stdarg.h>
#include <stdio.h>
#include <array>
#include <algorithm>

// Include platform-specific headers

// ESP32 specific headers
#if defined(ARDUINO_ARCH_ESP32) || defined(ESP_PLATFORM)
    #include "esp_timer.h"
#endif

// STM32 specific headers (includes HAL & everything else)
// assuming the project was created using STM32CubeMX
#if defined(STM32_HAL)
    #include "main.h"
#endif

// RP2040 specific headers
#if defined(PICO_SDK)
    #include "pico/stdlib.h"
    #include "pico/time.h"
#endif

// FreeRTOS port & primitives (only the log sink needs them)
#if defined(ARDUINO_ARCH_ESP32) || defined(ESP_PLATFORM)
    #include "freertos/FreeRTOS.h"
    #include "freertos/task.h"
    #include "freertos/queue.h"
    #define MBCODEC_RTOS 1
#elif defined(STM32_HAL) || defined(PICO_SDK)
    #include "FreeRTOS.h"
    #include "task.h"
    #include "queue.h"
    #define MBCODEC_RTOS 1
#else
    #include <chrono>
    #define MBCODEC_RTOS 0
#endif

// ===================================================================================
// FREERTOS TASK STACK SIZE CONVERSION MACRO
// ===================================================================================

// - On ESP32 FreeRTOS port, stack size should be defined in bytes.
// - On "vanilla" FreeRTOS port, stack size should be defined in words (4 bytes each).
// - Stack sizes are defined in bytes in the library.

#if defined(ARDUINO_ARCH_ESP32) || defined(ESP_PLATFORM)
    constexpr uint32_t BYTES_TO_STACK_SIZE(const uint32_t stackSizeBytes) {
        return stackSizeBytes;
    }
#elif defined(PICO_SDK) && defined(MBCODEC_DEBUG)
    constexpr uint32_t BYTES_TO_STACK_SIZE(const uint32_t stackSizeBytes) {
        return (stackSizeBytes + 256) / 4; // snprintf overhead on RP2040
    }
#else
    constexpr uint32_t BYTES_TO_STACK_SIZE(const uint32_t stackSizeBytes) {
        return stackSizeBytes / 4;
    }
#endif

// ===================================================================================
// TIMING
// ===================================================================================

#if defined(ARDUINO_ARCH_ESP32) || defined(ESP_PLATFORM)
    inline uint64_t TIME_US()           { return esp_timer_get_time(); }
#elif defined(STM32_HAL)
    inline uint64_t TIME_US()           { return (uint64_t)HAL_GetTick() * 1000; }
#elif defined(PICO_SDK)
    inline uint64_t TIME_US()           { return time_us_64(); }
#else
    // Hosted builds (native tests, Linux tools)
    inline uint64_t TIME_US() {
        using namespace std::chrono;
        return (uint64_t)duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count();
    }
#endif

namespace ModbusTypeDef {

// ===================================================================================
// BYTEBUFFER
// ===================================================================================

/* @brief "Vector-like" minimalistic facade on a raw static buffer
 * @note Every decode input & encode output of the codec goes through this class.
 * @note It doesn't own the buffer, it only references it (similar to std::span in C++20).
 */
class ByteBuffer {
public:
    ByteBuffer() noexcept
    : _data(nullptr), _size(0), _cap(0) {}

    /* @brief Construct an empty read/write ByteBuffer.
     * @param ptr The pointer to the storage.
     * @param capacity The capacity of the storage.
     * @note The storage is not cleared: bytes beyond size() are never read.
     * @note A non-const array selects this overload and gives an EMPTY buffer,
     *       even if it already holds received bytes. To decode such bytes, use
     *       the read-only overload (static_cast<const uint8_t*>(rx)) or fill
     *       the buffer through resize() + begin() + trim().
     */
    ByteBuffer(uint8_t* ptr, size_t capacity) noexcept
        : _data(ptr), _size(0), _cap(capacity) {}

    /* @brief Construct a READ-ONLY ByteBuffer over received bytes.
     * @param ptr The pointer to the bytes.
     * @param size The number of valid bytes.
     */
    ByteBuffer(const uint8_t* ptr, size_t size) noexcept
        : _data(const_cast<uint8_t*>(ptr)), _size(size), _cap(size) {}

    // No copy allowed
    ByteBuffer(const ByteBuffer&) = delete;
    ByteBuffer& operator=(const ByteBuffer&) = delete;
    // Move allowed
    ByteBuffer(ByteBuffer&&) noexcept = default;
    ByteBuffer& operator=(ByteBuffer&&) noexcept = default;

    // READ-ONLY ACCESSORS

    const uint8_t* data() const { return _data; }
    size_t         size() const { return _size; }
    size_t     capacity() const { return _cap; }
    bool          empty() const { return _size == 0; }
    size_t   free_space() const { return _cap - _size; }
    const uint8_t& operator[](size_t i) const { return _data[i]; }
    // Big-endian 16-bit read (Modbus wire order), caller checks bounds
    uint16_t getU16(size_t i) const {
        return (uint16_t)((_data[i] << 8) | _data[i + 1]);
    }

    // ITERATORS
    //
    // The non-const iterators give raw write access for APIs that fill a
    // pointer directly (UART read, socket recv). They do not manage capacity:
    // 1. Reserve space first: buffer.resize(expected_max_size)
    // 2. Pass buffer.begin() [+ offset] to the function that writes to it
    // 3. Adjust size to the actual data: buffer.trim(offset + bytes_read)

    uint8_t*       begin()       { return _data; }
    uint8_t*       end()         { return _data + _size; }
    const uint8_t* begin() const { return _data; }
    const uint8_t* end()   const { return _data + _size; }

    // READ-ONLY SLICE

    ByteBuffer slice(size_t offset, size_t length) const {
        if (!_data || offset > _size) return ByteBuffer();
        if (offset + length > _size) length = _size - offset;
        return ByteBuffer(static_cast<const uint8_t*>(_data + offset), length);
    }

    // WRITING

    void clear() { _size = 0; }

    // New bytes read as 0 until overwritten
    bool resize(size_t newSize) {
        if (newSize > _cap || !_data) return false;
        if (newSize > _size) memset(_data + _size, 0, newSize - _size);
        _size = newSize;
        return true;
    }

    // Only shrinks: restores the buffer to a previous size
    bool trim(size_t newSize) {
        if (newSize > _size) return false;
        _size = newSize;
        return true;
    }
    bool push_back(uint8_t b) {
        if (_size >= _cap || !_data) return false;
        _data[_size++] = b;
        return true;
    }
    bool push_back(const uint8_t* buf, size_t len) { // Atomic operation: all bytes in buf will be written or none
        if (len > free_space() || !_data) return false;
        if (len) memcpy(_data + _size, buf, len);
        _size += len;
        return true;
    }
    bool push_u16(uint16_t v) {
        if (free_space() < 2 || !_data) return false;
        _data[_size++] = (uint8_t)(v >> 8);
        _data[_size++] = (uint8_t)(v & 0xFF);
        return true;
    }

    // CONSUME THE FIRST N BYTES WHILE KEEPING THE CAPACITY
    // (drops a decoded frame from a receive buffer)

    bool pop_front(size_t n) {
        if (n > _size) return false;
        if (n) {
            memmove(_data, _data + n, _size - n);
            _size -= n;
        }
        return true;
    }

private:
    uint8_t* _data;
    size_t   _size;
    size_t   _cap;
};


// ===================================================================================
// CALL CONTEXT (used in Modbus::Debug)
// ===================================================================================

/* @brief Context structure to capture call location information
 */
struct CallCtx {
    const char* file;
    const char* function;
    int line;

    CallCtx(const char* f = __builtin_FILE(),
            const char* func = __builtin_FUNCTION(),
            int l = __builtin_LINE())
        : file(f), function(func), line(l) {}
};

/* @brief Utility function to extract the filename from a full path
 * @param path The full path to extract the filename from
 * @return The filename
 */
inline const char* getBasename(const char* path) {
    const char* basename = path;

    const char* lastSlash = strrchr(path, '/');
    if (lastSlash) basename = lastSlash + 1;

    const char* lastBackslash = strrchr(path, '\\');
    if (lastBackslash && lastBackslash > basename) basename = lastBackslash + 1;

    return basename;
}

} // namespace ModbusTypeDef


// ===================================================================================
// ModbusTypeDef ALIASING IN ALL NAMESPACES
// ===================================================================================

namespace Modbus {
    using CallCtx = ModbusTypeDef::CallCtx;
    using ByteBuffer = ModbusTypeDef::ByteBuffer;
}

namespace ModbusCodec {
    using CallCtx = ModbusTypeDef::CallCtx;
    using ByteBuffer = ModbusTypeDef::ByteBuffer;
}
