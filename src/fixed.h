/*
    Copyright 2019-2025 Hydr8gon

    This file is part of GeoDS.

    GeoDS is free software: you can redistribute it and/or modify it
    under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    GeoDS is distributed in the hope that it will be useful, but
    WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
    General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with GeoDS. If not, see <https://www.gnu.org/licenses/>.
*/

#ifndef FIXED_H
#define FIXED_H

#include <cstdint>

#include "defines.h"

// Signed fixed-point value with 12 fractional bits, as used by the geometry engine
// Results wrap around on 32-bit overflow like the hardware registers do
struct Fixed12
{
    int32_t value = 0;

    Fixed12() {}
    explicit Fixed12(int32_t integer): value(wrap((int64_t)integer * 4096)) {}

    static Fixed12 fromRaw(int32_t raw)
    {
        Fixed12 result;
        result.value = raw;
        return result;
    }

    FORCE_INLINE int32_t toInt() const { return value >> 12; }
    double toDouble() const { return value / 4096.0; }

    FORCE_INLINE Fixed12 operator+(Fixed12 f) const { return fromRaw(wrap((int64_t)value + f.value)); }
    FORCE_INLINE Fixed12 operator-(Fixed12 f) const { return fromRaw(wrap((int64_t)value - f.value)); }
    FORCE_INLINE Fixed12 operator-() const { return fromRaw(wrap(-(int64_t)value)); }

    // Multiply two fixed-point values, keeping the 64-bit intermediate
    FORCE_INLINE Fixed12 operator*(Fixed12 f) const { return fromRaw(wrap(((int64_t)value * f.value) >> 12)); }

    // Divide two fixed-point values; the divisor must be non-zero
    FORCE_INLINE Fixed12 operator/(Fixed12 f) const { return fromRaw(wrap(((int64_t)value * 4096) / f.value)); }

    // Add or divide by a plain integer
    FORCE_INLINE Fixed12 addInt(int32_t i) const { return *this + Fixed12(i); }
    FORCE_INLINE Fixed12 divInt(int32_t i) const { return fromRaw(value / i); }

    Fixed12 &operator+=(Fixed12 f) { return *this = *this + f; }

    bool operator==(Fixed12 f) const { return value == f.value; }
    bool operator!=(Fixed12 f) const { return value != f.value; }
    bool operator<(Fixed12 f) const { return value < f.value; }
    bool operator>(Fixed12 f) const { return value > f.value; }

    private:
        static FORCE_INLINE int32_t wrap(int64_t v) { return (int32_t)(uint32_t)(uint64_t)v; }
};

#endif // FIXED_H
