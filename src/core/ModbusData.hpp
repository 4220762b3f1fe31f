/**
 * @file ModbusData.hpp
 * @brief Bounded payload containers (registers, coils, raw bytes)
 * @note No heap allocation: every container embeds its storage, sized
 *       to the largest payload a single PDU can carry.
 */

#pragma once

#include "core/ModbusCore.h"
#include <initializer_list>

namespace Modbus {

    // FC + byte count + 2 bytes per register
    constexpr size_t REGISTERS_CAPACITY = (MAX_PDU_SIZE - 2) / 2;
    // Read coils response: FC + byte count + packed bits
    constexpr size_t COILS_CAPACITY = MAX_COILS_READ;
    constexpr size_t COILS_CAPACITY_BYTES = (COILS_CAPACITY + 7) / 8;
    // Opaque payload of custom functions: everything after the FC
    constexpr size_t BYTES_CAPACITY = MAX_PDU_DATA_SIZE;

    static_assert(REGISTERS_CAPACITY >= MAX_REGISTERS_READ, "Register container too small");
    static_assert(COILS_CAPACITY_BYTES + 2 <= MAX_PDU_SIZE, "Coil container exceeds PDU size");

    /* @brief Number of bytes needed to pack a number of coils
     */
    constexpr size_t packedCoilsSize(size_t coilCount) {
        return (coilCount + 7) / 8;
    }

// ===================================================================================
// FIXED CAPACITY VECTOR
// ===================================================================================

/* @brief Ordered sequence with an explicit length over embedded storage
 * @note Writes past the capacity are refused (return false), never truncated.
 */
template<typename T, size_t N>
class FixedVector {
public:
    static constexpr size_t CAPACITY = N;

    FixedVector() : _size(0) { _data.fill(T()); }

    size_t     size() const { return _size; }
    size_t capacity() const { return N; }
    bool      empty() const { return _size == 0; }
    bool       full() const { return _size == N; }
    const T*   data() const { return _data.data(); }
    const T&   operator[](size_t i) const { return _data[i]; }
    const T*  begin() const { return _data.data(); }
    const T*    end() const { return _data.data() + _size; }

    bool get(size_t i, T& out) const {
        if (i >= _size) return false;
        out = _data[i];
        return true;
    }

    // Writing at i >= size() extends the size (intermediate slots read as 0)
    bool set(size_t i, T value) {
        if (i >= N) return false;
        if (i >= _size) {
            std::fill(_data.begin() + _size, _data.begin() + i, T());
            _size = i + 1;
        }
        _data[i] = value;
        return true;
    }

    bool push_back(T value) {
        if (_size >= N) return false;
        _data[_size++] = value;
        return true;
    }

    // All or nothing
    bool assign(const T* values, size_t count) {
        if (count > N || (count && !values)) return false;
        std::copy(values, values + count, _data.begin());
        _size = count;
        return true;
    }

    bool resize(size_t newSize) {
        if (newSize > N) return false;
        if (newSize > _size) std::fill(_data.begin() + _size, _data.begin() + newSize, T());
        _size = newSize;
        return true;
    }

    void clear() { _size = 0; }

    bool operator==(const FixedVector& other) const {
        return _size == other._size && std::equal(begin(), end(), other.begin());
    }
    bool operator!=(const FixedVector& other) const { return !(*this == other); }

protected:
    std::array<T, N> _data;
    size_t _size;
};

// ===================================================================================
// RAW BYTES
// ===================================================================================

// Opaque payloads: custom function codes, comm event log, server ID
using Bytes = FixedVector<uint8_t, BYTES_CAPACITY>;

// ===================================================================================
// REGISTERS
// ===================================================================================

/* @brief 16-bit register words carried by read/write register functions
 * @note Typed setters return the number of registers written (0 on failure)
 *       and extend size() when writing past the end. Typed getters fail
 *       when reading past size().
 */
class Registers : public FixedVector<uint16_t, REGISTERS_CAPACITY> {
public:
    Registers() = default;
    // More than CAPACITY values: stays empty, rejected by every register count check
    Registers(std::initializer_list<uint16_t> values) {
        if (!assign(values.begin(), values.size())) clear();
    }

    size_t setFloat(float value, size_t index, ByteOrder order = ByteOrder::ABCD);
    size_t setUint32(uint32_t value, size_t index, ByteOrder order = ByteOrder::ABCD);
    size_t setInt32(int32_t value, size_t index, ByteOrder order = ByteOrder::ABCD);
    size_t setUint16(uint16_t value, size_t index, ByteOrder order = ByteOrder::AB);
    size_t setInt16(int16_t value, size_t index, ByteOrder order = ByteOrder::AB);

    bool getFloat(float& value, size_t index, ByteOrder order = ByteOrder::ABCD) const;
    bool getUint32(uint32_t& value, size_t index, ByteOrder order = ByteOrder::ABCD) const;
    bool getInt32(int32_t& value, size_t index, ByteOrder order = ByteOrder::ABCD) const;
    bool getUint16(uint16_t& value, size_t index, ByteOrder order = ByteOrder::AB) const;
    bool getInt16(int16_t& value, size_t index, ByteOrder order = ByteOrder::AB) const;

private:
    static bool is32BitOrder(ByteOrder order);
    static bool is16BitOrder(ByteOrder order);
};

// ===================================================================================
// COILS
// ===================================================================================

/* @brief Bit flags stored packed the way they travel on the wire
 * @note LSB-first within each byte, coils filled low-to-high.
 *       Unused high bits of the last byte are always 0.
 */
class Coils {
public:
    static constexpr size_t CAPACITY = COILS_CAPACITY;

    Coils() : _count(0) { _packed.fill(0); }
    Coils(std::initializer_list<bool> states) : Coils() {
        for (bool s : states) push_back(s);
    }

    size_t       size() const { return _count; }
    size_t   capacity() const { return CAPACITY; }
    bool        empty() const { return _count == 0; }
    size_t packedSize() const { return packedCoilsSize(_count); }
    const uint8_t* packed() const { return _packed.data(); }

    bool operator[](size_t i) const {
        return (_packed[i / 8] >> (i % 8)) & 0x01;
    }

    bool get(size_t i, bool& out) const {
        if (i >= _count) return false;
        out = (*this)[i];
        return true;
    }

    // Writing at i >= size() extends the size (intermediate coils are OFF)
    bool set(size_t i, bool state) {
        if (i >= CAPACITY) return false;
        if (i >= _count) _count = i + 1;
        uint8_t mask = (uint8_t)(1u << (i % 8));
        if (state) _packed[i / 8] |= mask;
        else       _packed[i / 8] &= (uint8_t)~mask;
        return true;
    }

    bool push_back(bool state) {
        if (_count >= CAPACITY) return false;
        return set(_count, state);
    }

    /* @brief Load coils from their packed wire representation
     * @param bytes Packed bytes (at least packedCoilsSize(count))
     * @param count Number of coils to keep
     * @return false if count exceeds the capacity (container unchanged)
     */
    bool assignPacked(const uint8_t* bytes, size_t count) {
        if (count > CAPACITY || (count && !bytes)) return false;
        _packed.fill(0);
        size_t n = packedCoilsSize(count);
        if (n) memcpy(_packed.data(), bytes, n);
        _count = count;
        clearPadding();
        return true;
    }

    bool resize(size_t newCount) {
        if (newCount > CAPACITY) return false;
        _count = newCount;
        clearPadding();
        // Bytes beyond the last one in use are zeroed as well
        size_t used = packedSize();
        std::fill(_packed.begin() + used, _packed.end(), 0);
        return true;
    }

    void clear() {
        _count = 0;
        _packed.fill(0);
    }

    // Padding bits are always 0, so a byte compare is enough
    bool operator==(const Coils& other) const {
        return _count == other._count
            && std::equal(_packed.begin(), _packed.begin() + packedSize(), other._packed.begin());
    }
    bool operator!=(const Coils& other) const { return !(*this == other); }

private:
    std::array<uint8_t, COILS_CAPACITY_BYTES> _packed;
    size_t _count;

    void clearPadding() {
        size_t rem = _count % 8;
        if (rem) _packed[_count / 8] &= (uint8_t)((1u << rem) - 1);
    }
};

} // namespace Modbus
