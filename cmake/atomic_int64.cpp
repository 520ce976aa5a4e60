// checks whether 64-bit atomics (used for the statistics)
// work without linking libatomic
#include <stdint.h>
#include <atomic>

std::atomic<int64_t> counter{0};

int main() {
    counter.fetch_add(1);
    return counter.load() == 1 ? 0 : 1;
}
