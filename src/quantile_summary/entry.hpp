#pragma once

#include <cmath>
#include <cstdint>
#include <ostream>
#include <tuple>
#include <type_traits>

// A retained observation.
//   g     : number of observations covered since the previous entry (min rank gap)
//   delta : extra uncertainty on the maximum rank of this entry
// The rank of `value` lies in [sum of g up to here, that sum + delta].
template <typename T> struct Entry {
    T value;
    uint64_t g;
    uint64_t delta;

    static Entry exact(const T &value) { return Entry{value, 1, 0}; }

    auto to_tuple() const { return std::make_tuple(value, g, delta); }

    bool operator<(const Entry &other) const { return value < other.value; }
    bool operator==(const Entry &other) const { return to_tuple() == other.to_tuple(); }
    bool operator!=(const Entry &other) const { return !(*this == other); }

    friend std::ostream &operator<<(std::ostream &os, const Entry &entry) {
        os << "(" << entry.value << ", " << entry.g << ", " << entry.delta << ")";
        return os;
    }
};

// Values that compare unordered against themselves cannot be placed in a sorted summary.
template <typename T> bool is_orderable(const T &value) {
    if constexpr (std::is_floating_point_v<T>) {
        return !std::isnan(value);
    } else {
        return true;
    }
}
