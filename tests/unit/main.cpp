#include "core/v6n_log.h"

#define CATCH_CONFIG_RUNNER
#include "catch.hpp"

int main(int argc, char* argv[])
{
    /* Rejected input is logged at debug level; keep test output readable */
    v6n_log_level_set(V6N_LOG_ERROR);

    return (Catch::Session().run(argc, argv));
}
