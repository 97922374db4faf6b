#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "src/client/client_options.hpp"
#include "src/client/relay_client.hpp"
#include "src/error/relay_error.hpp"
#include "src/transport/interface.hpp"
#include "src/utils/logger.hpp"

int main(int argc, char** argv) {
    try {
        //
        // Collect
        //

        relay::log::configure_from_env();

        std::vector<std::string> urls(argv + 1, argv + argc);
        if (urls.empty()) {
            std::cout << "usage: relay_cli URL..." << std::endl;
            return 1;
        }

        const auto options = relay::client::ClientOptions::from_env();

        auto client = relay::client::RelayClientBuilder().with_options(options).validate().build();

        //
        // Dispatch
        //

        const auto results = client->batch_get(urls);

        //
        // Report
        //

        int failures = 0;
        for (std::size_t i = 0; i < results.size(); ++i) {
            if (const auto* response = std::get_if<relay::model::Response>(&results[i])) {
                std::cout << urls[i] << " -> " << response->status_code_ << " " << response->version_ << " " << response->elapsed_ms_ << "ms "
                          << response->body_.size() << " bytes\n";
            } else {
                const auto& err = std::get<relay::error::StructuredError>(results[i]);
                std::cout << urls[i] << " -> " << relay::error::to_string(err.code_) << ": " << err.message_ << "\n";
                ++failures;
            }
        }

        std::cout << results.size() - failures << "/" << results.size() << " succeeded (pool " << options.pool_size_ << ", framing "
                  << relay::transport::to_string(options.framing_) << ")" << std::endl;

        client->close();
        return failures == 0 ? 0 : 3;
    } catch (const relay::error::RelayError& e) {
        std::cerr << "Relay Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }
}
