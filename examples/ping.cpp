// Check that spamd is up.
//
//   cmake -B build -DSPAMC_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/example_ping [address]

#include "spamc/client.hpp"
#include <iostream>

int main(int argc, char** argv) {
    const char* address = argc > 1 ? argv[1] : "localhost:783";

    try {
        auto client = spamc::Client::create(spamc::ClientConfig::builder().address(address).build());
        auto result = client->ping();
        std::cout << address << ": " << (result.pong ? "PONG" : result.response.status_message)
                  << std::endl;
        return result.pong ? 0 : 1;
    } catch (const spamc::SpamcError& e) {
        std::cerr << address << ": " << e.what() << std::endl;
        return 1;
    }
}
