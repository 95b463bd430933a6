#include "mock_client.hpp"

#include <random>
#include <string>

#include "../../json/value.hpp"
#include "../../utils/constants.hpp"

namespace http::client {

    MockClient::MockClient() : rng_(std::random_device{}()) {}

    MockClient::MockClient(unsigned int seed) : rng_(seed) {}

    http::model::Response MockClient::send(const http::model::Request& req) {
        std::uniform_int_distribution<size_t> pick(0, constants::MOCK_STATUS_CODES.size() - 1);
        std::uniform_real_distribution<double> elapsed(constants::MOCK_MIN_ELAPSED_MS, constants::MOCK_MAX_ELAPSED_MS);

        const long status = constants::MOCK_STATUS_CODES.at(pick(rng_));

        json::Value body{json::Object{}};
        body.set("mock", true);
        body.set("status", status);
        body.set("message", "This is a mock response.");

        http::model::Response r;
        r.status_ = status;
        r.reason_ = status == 500 ? "Server Error" : http::model::reason_phrase(status);
        r.body_ = body.dump(constants::JSON_INDENT);
        r.byte_length_ = r.body_.size();
        r.headers_ = {{"Content-Type", "application/json"}};
        r.simulated_elapsed_ms_ = elapsed(rng_);
        return r;
    }

}  // namespace http::client
