#pragma once

#include <print>
#include <source_location>
#include <string>


namespace test {

    inline int& failure_count() {
        static int count = 0;
        return count;
    }

    inline bool check(
        bool condition,
        const std::string& what,
        const std::source_location loc = std::source_location::current()
    ) {
        if (!condition) {
            ++failure_count();
            std::println(
                "FAILED {}:{}: {}", loc.file_name(), loc.line(), what
            );
        }
        return condition;
    }

    inline int finish(const char* suite) {
        if (failure_count() == 0) {
            std::println("{}: all checks passed", suite);
            return 0;
        }

        std::println("{}: {} checks failed", suite, failure_count());
        return 1;
    }

}  // namespace test
