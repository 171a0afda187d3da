#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <string>
#include <vector>

#include "dotenvpp/infra/process.hpp"

using namespace dotenvpp;

TEST_CASE("run_process returns the exit code", "[infra][process]") {
    auto ok = infra::run_process("/bin/sh", {"-c", "exit 0"}, {});
    REQUIRE(ok.has_value());
    CHECK(*ok == 0);

    auto failed = infra::run_process("/bin/sh", {"-c", "exit 7"}, {});
    REQUIRE(failed.has_value());
    CHECK(*failed == 7);
}

TEST_CASE("run_process passes only the given environment", "[infra][process]") {
    ::setenv("DOTENVPP_PARENT_ONLY", "leaked", 1);
    std::vector<std::string> env = {"ONLY_VAR=present"};
    auto status = infra::run_process(
        "/bin/sh",
        {"-c", "test \"$ONLY_VAR\" = present && test -z \"$DOTENVPP_PARENT_ONLY\""},
        env);
    REQUIRE(status.has_value());
    CHECK(*status == 0);
}

TEST_CASE("run_process reports signals as 128 + signal", "[infra][process]") {
    auto status = infra::run_process("/bin/sh", {"-c", "kill -TERM $$"}, {});
    REQUIRE(status.has_value());
    CHECK(*status == 128 + 15);
}

TEST_CASE("run_process with a missing executable", "[infra][process]") {
    auto status = infra::run_process("/nonexistent/dotenvpp-no-such-binary", {}, {});
    REQUIRE(status.has_value());
    CHECK(*status == infra::kExecFailedStatus);
}

TEST_CASE("run_process rejects an empty command", "[infra][process]") {
    auto status = infra::run_process("", {}, {});
    REQUIRE_FALSE(status.has_value());
    CHECK(status.error().code() == ErrorCode::InvalidArgument);
}
