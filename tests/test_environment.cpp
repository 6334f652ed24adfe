#include <gtest/gtest.h>
#include "http_client.hpp"
#include "localization.hpp"

class CrxgetEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        init_localization();
    }

    void TearDown() override {
        curl_global_cleanup();
    }
};

static ::testing::Environment* const crxget_environment =
    ::testing::AddGlobalTestEnvironment(new CrxgetEnvironment);
