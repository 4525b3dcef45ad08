// Score a message read from stdin, like `spamc -c`.
//
//   cmake -B build -DSPAMC_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/example_check < message.eml
//
// Override the daemon address:
//
//   SPAMD_ADDRESS=unix:/var/run/spamd.sock ./build/example_check < message.eml
//
// Exit status is 1 for spam, 0 for ham, 2 on error.

#include "spamc/client.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>

int main() {
    std::string address = "localhost:783";
    if (const char* env = std::getenv("SPAMD_ADDRESS")) {
        address = env;
    }

    std::string message((std::istreambuf_iterator<char>(std::cin)),
                        std::istreambuf_iterator<char>());

    try {
        auto config = spamc::ClientConfig::builder()
            .address(address)                                     // default: localhost:783
            .connect_timeout(std::chrono::milliseconds(5000))     // default: 5s
            .request_timeout(std::chrono::milliseconds(30000))    // default: 30s
            .max_connect_retries(3)                               // default: 3 retries
            .on_error([](const spamc::SpamcError& e) {            // default: errors are silent
                std::cerr << "[spamc] " << e.what() << std::endl;
            })
            .build();
        auto client = spamc::Client::create(std::move(config));

        auto result = client->check(message);
        std::cout << result.spam.score << "/" << result.spam.threshold << std::endl;
        client->close();
        return result.is_spam() ? 1 : 0;
    } catch (const spamc::SpamcError& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 2;
    }
}
