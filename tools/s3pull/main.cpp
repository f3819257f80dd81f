#include <spdlog/spdlog.h>
#include <s3pull/cli/s3pull_cli.hpp>

int main(int argc, char* argv[]) {
    try {
        s3pull::cli::S3PullCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
