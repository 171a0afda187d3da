#include "dotenvpp/cli/app.hpp"
#include "dotenvpp/core/logger.hpp"

int main(int argc, char** argv) {
    dotenvpp::cli::App app;
    auto code = app.run(argc, argv);
    dotenvpp::Logger::flush();
    return code;
}
