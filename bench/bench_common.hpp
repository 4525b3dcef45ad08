// bench/bench_common.hpp
// Shared benchmark scenarios: message sizes seen by a mail filter.

#pragma once

#include <cstddef>
#include <string>

namespace spamc_bench {

struct BenchScenario {
    const char* name;
    size_t message_size;
};

constexpr BenchScenario SCENARIOS[] = {
    {"short_note", 1024},
    {"typical", 16 * 1024},
    {"newsletter", 128 * 1024},
    {"attachment", 1024 * 1024},
};

constexpr size_t SCENARIO_COUNT = sizeof(SCENARIOS) / sizeof(SCENARIOS[0]);

// RFC 5322 message of approximately the given size in bytes.
inline std::string generate_message(size_t size) {
    std::string msg =
        "From: bench@example.com\r\n"
        "To: rcpt@example.com\r\n"
        "Subject: Benchmark message\r\n"
        "Message-ID: <bench-123@example.com>\r\n"
        "\r\n";

    const std::string line = "Lorem ipsum dolor sit amet, consectetur adipiscing elit.\r\n";
    while (msg.size() + line.size() <= size) msg += line;
    if (msg.size() < size) msg.append(size - msg.size(), 'x');
    return msg;
}

} // namespace spamc_bench
