#pragma once
// Posting: the set of resource slots carrying one (label key, value) pair
//
// Thin owner of a roaring bitmap. Slots are dense 32-bit ids handed out
// by the label store, so bitmaps stay compact and unions/intersections
// across value buckets are cheap.

#include <roaring/roaring.h>
#include <cstdint>
#include <new>
#include <utility>
#include <vector>

namespace zebra {

class Posting {
public:
    Posting() : bitmap_(roaring_bitmap_create()) {
        if (!bitmap_) throw std::bad_alloc();
    }

    ~Posting() {
        if (bitmap_) roaring_bitmap_free(bitmap_);
    }

    Posting(const Posting&) = delete;
    Posting& operator=(const Posting&) = delete;

    Posting(Posting&& other) noexcept : bitmap_(std::exchange(other.bitmap_, nullptr)) {}

    Posting& operator=(Posting&& other) noexcept {
        if (this != &other) {
            if (bitmap_) roaring_bitmap_free(bitmap_);
            bitmap_ = std::exchange(other.bitmap_, nullptr);
        }
        return *this;
    }

    void add(uint32_t slot) { roaring_bitmap_add(bitmap_, slot); }
    void remove(uint32_t slot) { roaring_bitmap_remove(bitmap_, slot); }

    bool contains(uint32_t slot) const { return roaring_bitmap_contains(bitmap_, slot); }
    bool empty() const { return roaring_bitmap_is_empty(bitmap_); }
    uint64_t cardinality() const { return roaring_bitmap_get_cardinality(bitmap_); }
    size_t size_in_bytes() const { return roaring_bitmap_size_in_bytes(bitmap_); }

    // Smallest slot; only meaningful when !empty()
    uint32_t minimum() const { return roaring_bitmap_minimum(bitmap_); }

    // this |= other
    void merge(const Posting& other) { roaring_bitmap_or_inplace(bitmap_, other.bitmap_); }

    // this &= other
    void intersect(const Posting& other) { roaring_bitmap_and_inplace(bitmap_, other.bitmap_); }

    // Ascending slot order
    std::vector<uint32_t> slots() const {
        std::vector<uint32_t> result(cardinality());
        if (!result.empty()) roaring_bitmap_to_uint32_array(bitmap_, result.data());
        return result;
    }

    const roaring_bitmap_t* raw() const { return bitmap_; }

private:
    roaring_bitmap_t* bitmap_;
};

} // namespace zebra
