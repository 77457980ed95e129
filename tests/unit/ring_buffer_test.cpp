#undef NDEBUG
#include <cassert>
#include "livescribe/core/ring_buffer.hpp"

using livescribe::RingBuffer;

int main() {
    RingBuffer<float> rb(4);
    assert(rb.size() == 0);
    assert(rb.average() == 0.0f);

    rb.push(1.0f);
    rb.push(2.0f);
    rb.push(3.0f);
    assert(rb.size() == 3 && !rb.full());
    assert(rb.average() == 2.0f);

    rb.push(4.0f);
    assert(rb.full());
    rb.push(5.0f);  // overwrites 1
    assert(rb.size() == 4);
    assert(rb.average() == 3.5f);

    assert(rb.percentile(0.0) == 2.0f);
    assert(rb.percentile(0.2) == 2.0f);
    assert(rb.percentile(0.5) == 4.0f);
    assert(rb.percentile(1.0) == 5.0f);

    rb.clear();
    assert(rb.size() == 0 && !rb.full());
    return 0;
}
