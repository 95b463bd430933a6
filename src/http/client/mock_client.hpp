#ifndef POST_MAKER_MOCK_CLIENT_HPP
#define POST_MAKER_MOCK_CLIENT_HPP

#include <random>

#include "../model/model.hpp"
#include "interface.hpp"

namespace http::client {

    // Answers every request with a canned JSON body and a status drawn from MOCK_STATUS_CODES,
    // without touching the network. Debug mode only.
    class MockClient : public IHttpClient {
       public:
        MockClient();
        explicit MockClient(unsigned int seed);

        http::model::Response send(const http::model::Request& req) override;

       private:
        std::minstd_rand rng_;
    };

}  // namespace http::client

#endif
