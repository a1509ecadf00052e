#include <string_view>

#include "check.hpp"
#include "fixtures.hpp"
#include "pngstash/image/crc.hpp"


namespace {

    void test_check_values() {
        test::check(pngstash::crc32(nullptr, 0) == 0, "crc of empty input");

        const auto digits = test::to_bytes("123456789");
        test::check(
            pngstash::crc32(digits) == 0xCBF43926, "standard check value"
        );
    }

    void test_incremental() {
        const auto whole = test::to_bytes("IENDsome chunk data");
        const auto head = test::to_bytes("IEND");
        const auto tail = test::to_bytes("some chunk data");

        const auto partial = pngstash::crc32(head);
        const auto chained = pngstash::crc32(
            partial, tail.data(), tail.size()
        );
        test::check(
            chained == pngstash::crc32(whole),
            "chained crc equals crc of concatenation"
        );
    }

    void test_iend() {
        // Every PNG ends with the same IEND chunk
        test::check(
            pngstash::crc32(test::to_bytes("IEND")) == 0xAE426082,
            "crc of IEND type"
        );
    }

}  // namespace


int main() {
    ::test_check_values();
    ::test_incremental();
    ::test_iend();
    return test::finish("crc");
}
