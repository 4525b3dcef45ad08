// Train the Bayes database with a message from stdin, like `spamc -L`.
//
//   cmake -B build -DSPAMC_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/example_tell spam < junk.eml
//   ./build/example_tell ham < newsletter.eml
//   ./build/example_tell forget < misfiled.eml
//
// spamd must run with --allow-tell.

#include "spamc/client.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <iterator>
#include <string>

static bool parse_learn(const char* arg, spamc::LearnType& out) {
    if (std::strcmp(arg, "spam") == 0) out = spamc::LearnType::Spam;
    else if (std::strcmp(arg, "ham") == 0) out = spamc::LearnType::Ham;
    else if (std::strcmp(arg, "forget") == 0) out = spamc::LearnType::Forget;
    else if (std::strcmp(arg, "report") == 0) out = spamc::LearnType::Report;
    else if (std::strcmp(arg, "revoke") == 0) out = spamc::LearnType::Revoke;
    else return false;
    return true;
}

int main(int argc, char** argv) {
    spamc::LearnType learn;
    if (argc < 2 || !parse_learn(argv[1], learn)) {
        std::cerr << "usage: " << argv[0] << " spam|ham|forget|report|revoke < message" << std::endl;
        return 2;
    }

    std::string address = "localhost:783";
    if (const char* env = std::getenv("SPAMD_ADDRESS")) {
        address = env;
    }
    std::string message((std::istreambuf_iterator<char>(std::cin)),
                        std::istreambuf_iterator<char>());

    try {
        auto client = spamc::Client::create(spamc::ClientConfig::builder()
            .address(address)
            .user(std::getenv("USER") ? std::getenv("USER") : "")
            .build());

        auto result = client->tell(message, learn);
        if (!result.did_set.any() && !result.did_remove.any()) {
            std::cout << "Message was already un/learned" << std::endl;
        } else {
            if (result.did_set.any()) {
                std::cout << "Set: " << spamc::format_action(result.did_set) << std::endl;
            }
            if (result.did_remove.any()) {
                std::cout << "Removed: " << spamc::format_action(result.did_remove) << std::endl;
            }
        }
        client->close();
        return 0;
    } catch (const spamc::SpamcError& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
